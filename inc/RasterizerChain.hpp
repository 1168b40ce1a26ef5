#ifndef _RASTERIZER_CHAIN_HPP_
#define _RASTERIZER_CHAIN_HPP_

#include "ConversionStrategy.hpp"
#include "ExtractorOptions.hpp"
#include "PCH.h"
#include "RasterImage.hpp"
#include "SourceFile.hpp"

/**
 * @class RasterizerChain
 * @brief 任意 SourceFile -> RasterImage
 *
 * 位图直接解码，SVG 按目标尺寸渲染，专有矢量格式依次尝试转换策略。
 * 对象构造后只读，可在多个工作线程间共享。
 */
class RasterizerChain
{
public:
    RasterizerChain(std::vector<std::unique_ptr<ConversionStrategy>> strategies, const ExtractorOptions &options);

    // 默认策略顺序: ghostscript -> pdf-document -> embedded-preview
    static std::vector<std::unique_ptr<ConversionStrategy>> defaultStrategies(const ExtractorOptions &options);

    /**
     * @brief 栅格化一个文件
     * @throw PipelineError UnsupportedFormat / DecodeError / ConversionFailed / Timeout / Cancelled
     */
    RasterImage rasterize(const SourceFile &file, std::stop_token stopToken = {}) const;

    const std::vector<std::unique_ptr<ConversionStrategy>> &strategies() const
    {
        return m_strategies;
    }

private:
    RasterImage runStrategies(const SourceFile &file, std::stop_token stopToken) const;

    std::vector<std::unique_ptr<ConversionStrategy>> m_strategies;
    int m_vectorTargetSize;
    int m_maxRasterDimension;
    std::chrono::milliseconds m_timeout;
};

#endif
