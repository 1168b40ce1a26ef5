#ifndef _IMAGE_OPS_HPP_
#define _IMAGE_OPS_HPP_

#include "PCH.h"
#include "RasterImage.hpp"

#include <opencv2/core.hpp>

class QImage;

// OpenCV / Qt 与 RasterImage 之间的转换工具
namespace ImageOps
{
/**
 * @brief cv::imdecode 的输出 (BGR / BGRA / GRAY，8/16 位或浮点) 统一转为 RGBA8888
 * @throw PipelineError(DecodeError) 不支持的通道数或位深
 */
RasterImage fromDecodedMat(const cv::Mat &decoded);

// 包装为 CV_8UC4 (RGBA 顺序)，不复制数据，生命周期跟随 image
cv::Mat wrap(const RasterImage &image);

// 连续的 CV_8UC4 RGBA 矩阵复制为 RasterImage
RasterImage fromRgbaMat(const cv::Mat &rgba);

RasterImage fromQImage(const QImage &image);

/**
 * @brief 最长边超过 maxDimension 时按比例缩小 (INTER_AREA)，否则原样移动返回
 */
RasterImage fitWithin(RasterImage image, int maxDimension);
} // namespace ImageOps

#endif
