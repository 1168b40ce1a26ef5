#ifndef _SOURCE_FILE_HPP_
#define _SOURCE_FILE_HPP_

#include "PCH.h"

enum class FormatClass : std::uint8_t
{
    Raster,
    SvgVector,
    ProprietaryVector,
    Unknown
};

std::string_view toString(FormatClass formatClass);

// 小写扩展名，带点；没有扩展名时返回空串
std::string lowerExtension(const std::string &filename);

// 一次上传的单个文件，分类完成后不可变
class SourceFile
{
public:
    SourceFile(std::string filename, std::vector<std::uint8_t> bytes, FormatClass formatClass)
        : m_filename(std::move(filename)), m_bytes(std::move(bytes)), m_formatClass(formatClass)
    {
    }

    const std::string &filename() const
    {
        return m_filename;
    }
    const std::vector<std::uint8_t> &bytes() const
    {
        return m_bytes;
    }
    FormatClass formatClass() const
    {
        return m_formatClass;
    }

    std::string extension() const;

private:
    std::string m_filename;
    std::vector<std::uint8_t> m_bytes;
    FormatClass m_formatClass;
};

#endif
