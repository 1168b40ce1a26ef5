#ifndef _EMBEDDED_PREVIEW_STRATEGY_HPP_
#define _EMBEDDED_PREVIEW_STRATEGY_HPP_

#include "ConversionStrategy.hpp"

// 解码 DOS EPS 二进制头中嵌入的 TIFF 预览图，不依赖外部程序
class EmbeddedPreviewStrategy : public ConversionStrategy
{
public:
    std::string_view name() const override
    {
        return "embedded-preview";
    }

    bool accepts(const SourceFile &file) const override;
    RasterImage convert(const SourceFile &file, const ConversionBudget &budget) const override;
};

#endif
