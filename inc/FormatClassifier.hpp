#ifndef _FORMAT_CLASSIFIER_HPP_
#define _FORMAT_CLASSIFIER_HPP_

#include "PCH.h"
#include "SourceFile.hpp"

/**
 * @class FormatClassifier
 * @brief 根据文件内容签名（魔数 / XML 根元素）判断格式类别
 *
 * 先看签名，签名不明确时再看扩展名。纯函数，无副作用。
 */
class FormatClassifier
{
public:
    /**
     * @brief 判断格式类别
     * @param bytes 文件原始字节
     * @param filename 上传时声明的文件名（只用到扩展名）
     * @return 签名和扩展名都无法识别时返回 FormatClass::Unknown
     */
    static FormatClass classify(const std::vector<std::uint8_t> &bytes, const std::string &filename);

    /**
     * @brief 只看内容签名
     * @return 签名不明确时返回 std::nullopt
     */
    static std::optional<FormatClass> classifySignature(const std::vector<std::uint8_t> &bytes);

    // 只看扩展名 (大小写不敏感)
    static FormatClass classifyExtension(const std::string &filename);

    // DOS EPS 二进制头 C5 D0 D3 C6
    static bool isDosEps(const std::vector<std::uint8_t> &bytes);
    static bool isPdf(const std::vector<std::uint8_t> &bytes);
    static bool isPostScript(const std::vector<std::uint8_t> &bytes);
};

#endif
