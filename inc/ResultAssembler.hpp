#ifndef _RESULT_ASSEMBLER_HPP_
#define _RESULT_ASSEMBLER_HPP_

#include "ColorTypes.hpp"
#include "ExtractionResult.hpp"
#include "ExtractorOptions.hpp"
#include "PCH.h"
#include "RasterImage.hpp"

/**
 * @class ResultAssembler
 * @brief 聚类结果 -> 对外的颜色列表与预览图
 */
class ResultAssembler
{
public:
    explicit ResultAssembler(const ExtractorOptions &options);

    ExtractionResult assemble(const std::string &filename,
                              const std::vector<ColorCluster> &clusters,
                              const RasterImage &analyzed) const;

    // "white" / "black" 或大写 "#RRGGBB"
    static std::string colorName(const Rgb &color, int namedTolerance);

    /**
     * @brief 编码为 PNG 的 data URI，最长边超过 maxDimension 时先缩小
     * @throw PipelineError(DecodeError) PNG 编码失败
     */
    static std::string encodePreview(const RasterImage &image, int maxDimension);

private:
    ExtractorOptions m_options;
};

#endif
