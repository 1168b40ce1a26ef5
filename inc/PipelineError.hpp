#ifndef _PIPELINE_ERROR_HPP_
#define _PIPELINE_ERROR_HPP_

#include "PCH.h"

// 单个文件处理失败的分类，全部是文件级错误，不会中断整个批次
enum class ErrorKind : std::uint8_t
{
    UnsupportedFormat, // 签名和扩展名都无法识别
    ConversionFailed,  // 矢量转换链全部失败
    DecodeError,       // 位图解码器拒绝了数据
    EmptyImage,        // 解码后像素数为 0
    Timeout,           // 外部转换进程超时
    Cancelled          // 请求被取消，文件未处理完成
};

std::string_view toString(ErrorKind kind);

class PipelineError : public std::runtime_error
{
public:
    PipelineError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), m_kind(kind)
    {
    }

    ErrorKind kind() const
    {
        return m_kind;
    }

private:
    ErrorKind m_kind;
};

#endif
