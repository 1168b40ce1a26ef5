#ifndef COLOREXTRACTOR_H
#define COLOREXTRACTOR_H

#include "ColorTypes.hpp"
#include "ExtractorOptions.hpp"
#include "PCH.h"
#include "RasterImage.hpp"

struct Centroid
{
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
};

// r/g/b 是聚类空间 (归一化后) 的累加，shown 是对外报告的原始颜色累加
struct ClusterAccumulator
{
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    Centroid shown;
    size_t pixelCount = 0;
    size_t firstPixel = std::numeric_limits<size_t>::max();

    void add(const Centroid &p, size_t index)
    {
        add(p, p, index);
    }

    void add(const Centroid &p, const Centroid &reported, size_t index)
    {
        r += p.r;
        g += p.g;
        b += p.b;
        shown.r += reported.r;
        shown.g += reported.g;
        shown.b += reported.b;
        ++pixelCount;
        firstPixel = std::min(firstPixel, index);
    }

    void absorb(const ClusterAccumulator &other)
    {
        r += other.r;
        g += other.g;
        b += other.b;
        shown.r += other.shown.r;
        shown.g += other.shown.g;
        shown.b += other.shown.b;
        pixelCount += other.pixelCount;
        firstPixel = std::min(firstPixel, other.firstPixel);
    }

    Centroid mean() const
    {
        if (pixelCount == 0)
            return Centroid{};
        const double n = static_cast<double>(pixelCount);
        return Centroid{r / n, g / n, b / n};
    }

    Rgb toColor() const
    {
        if (pixelCount == 0)
            return Rgb{};
        const double n = static_cast<double>(pixelCount);
        Centroid m{shown.r / n, shown.g / n, shown.b / n};
        auto round8 = [](double v)
        {
            return static_cast<std::uint8_t>(std::clamp<long>(std::lround(v), 0, 255));
        };
        return Rgb{round8(m.r), round8(m.g), round8(m.b)};
    }
};

class ColorExtractor
{
public:
    explicit ColorExtractor(const ExtractorOptions &options);

    std::vector<ColorCluster> extract(const RasterImage &image) const;

    /**
     * @brief 在 analysis 上聚类，报告的颜色取 reference 中同位置像素的均值
     *
     * analysis 通常是色彩恒常归一化后的副本，reference 是归一化之前的图像，
     * 这样归一化只影响像素的归属，不改变报告出去的颜色。
     * @throw PipelineError(EmptyImage) 没有像素
     * @throw std::invalid_argument 两幅图尺寸不同
     */
    std::vector<ColorCluster> extract(const RasterImage &analysis, const RasterImage &reference) const;

    static double colorDistance(const Centroid &c1, const Centroid &c2);
    static double colorDistance(const Rgb &c1, const Rgb &c2);

    // 直方图峰值作为初始中心，数量即自适应的初始 K
    std::vector<Centroid> seedFromHistogram(const std::vector<Centroid> &samples) const;

private:
    std::vector<Centroid> samplePixels(const RasterImage &image) const;
    std::vector<Centroid> refine(const std::vector<Centroid> &samples, std::vector<Centroid> centroids) const;
    std::vector<ClusterAccumulator> labelAll(const RasterImage &analysis, const RasterImage &reference, const std::vector<Centroid> &centroids) const;

    bool mergeClose(std::vector<ClusterAccumulator> &clusters, bool onRoundedColors) const;
    bool dropNoise(std::vector<ClusterAccumulator> &clusters, size_t population) const;
    size_t noiseFloor(size_t population) const;

    ExtractorOptions m_options;
};

#endif // COLOREXTRACTOR_H
