#ifndef _PREPROCESSOR_HPP_
#define _PREPROCESSOR_HPP_

#include "ColorTypes.hpp"
#include "ExtractorOptions.hpp"
#include "PCH.h"
#include "RasterImage.hpp"

// 预处理结果：两幅图尺寸相同，像素一一对应
struct PreprocessedImage
{
    // 合成 + 缩小后的图像，聚类结果的颜色从这里取
    RasterImage composited;
    // 在 composited 基础上去噪 + 色彩恒常，只用于决定像素归属
    RasterImage normalized;
};

/**
 * @class Preprocessor
 * @brief 聚类前的图像归一化
 *
 * 顺序: alpha 合成 -> 缩小到分析尺寸 -> 双边滤波去噪 -> 灰度世界色彩恒常。
 * 所有步骤都在副本上进行，输入的解码缓冲不会被修改；输出的 alpha 恒为 255。
 * 归一化之前的合成图像同时保留，报告颜色时使用。
 */
class Preprocessor
{
public:
    explicit Preprocessor(const ExtractorOptions &options);

    PreprocessedImage process(const RasterImage &decoded) const;

    // out = src * a + bg * (1 - a)，四舍五入；完全透明的像素正好等于背景色
    static RasterImage compositeOnBackground(const RasterImage &image, Rgb background);

    // 边长都不小于 8 时才做双边滤波
    static RasterImage denoise(RasterImage image);

    /**
     * @brief 灰度世界假设：把每个通道的均值拉到三通道均值
     *
     * 任一通道均值低于 minChannelMean，或任一增益超出 [1/maxGain, maxGain] 时，
     * 认为图像不满足灰度世界假设 (例如大面积饱和色的标志)，原样返回。
     */
    static RasterImage grayWorld(const RasterImage &image, double maxGain, double minChannelMean);

private:
    ExtractorOptions m_options;
};

#endif
