#ifndef _SVG_RASTERIZER_HPP_
#define _SVG_RASTERIZER_HPP_

#include "PCH.h"
#include "RasterImage.hpp"

class SvgRasterizer
{
public:
    /**
     * @brief 将 SVG 文档渲染到透明画布上 (抗锯齿)
     * @param targetSize 最长边像素数，保持宽高比
     * @throw PipelineError(DecodeError) SVG 无法解析
     */
    static RasterImage render(const std::vector<std::uint8_t> &svgBytes, int targetSize);
};

#endif
