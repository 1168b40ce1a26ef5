#include "Preprocessor.hpp"
#include "ImageOps.hpp"

#include <opencv2/imgproc.hpp>

namespace
{
constexpr int K_MIN_DENOISE_SIDE = 8;
constexpr int K_BILATERAL_DIAMETER = 7;
constexpr double K_BILATERAL_SIGMA_COLOR = 75.0;
constexpr double K_BILATERAL_SIGMA_SPACE = 75.0;

inline std::uint8_t blend(std::uint8_t src, std::uint8_t bg, std::uint8_t alpha)
{
    return static_cast<std::uint8_t>((src * alpha + bg * (255 - alpha) + 127) / 255);
}
} // namespace

Preprocessor::Preprocessor(const ExtractorOptions &options)
    : m_options(options)
{
}

RasterImage Preprocessor::compositeOnBackground(const RasterImage &image, Rgb background)
{
    RasterImage out = image.clone();
    std::uint8_t *p = out.data();
    const size_t count = out.pixelCount();

    for (size_t i = 0; i < count; ++i, p += RasterImage::kChannels)
    {
        const std::uint8_t a = p[3];
        if (a == 255)
            continue;
        p[0] = blend(p[0], background.r, a);
        p[1] = blend(p[1], background.g, a);
        p[2] = blend(p[2], background.b, a);
        p[3] = 255;
    }
    return out;
}

RasterImage Preprocessor::denoise(RasterImage image)
{
    if (image.width() < K_MIN_DENOISE_SIDE || image.height() < K_MIN_DENOISE_SIDE)
        return image;

    // bilateralFilter 只接受 1 或 3 通道
    cv::Mat rgb, filtered, rgba;
    cv::cvtColor(ImageOps::wrap(image), rgb, cv::COLOR_RGBA2RGB);
    cv::bilateralFilter(rgb, filtered, K_BILATERAL_DIAMETER, K_BILATERAL_SIGMA_COLOR, K_BILATERAL_SIGMA_SPACE);
    cv::cvtColor(filtered, rgba, cv::COLOR_RGB2RGBA);
    return ImageOps::fromRgbaMat(rgba);
}

RasterImage Preprocessor::grayWorld(const RasterImage &image, double maxGain, double minChannelMean)
{
    RasterImage out = image.clone();
    const size_t count = out.pixelCount();
    if (count == 0)
        return out;

    std::array<double, 3> sums{0.0, 0.0, 0.0};
    const std::uint8_t *src = out.data();
    for (size_t i = 0; i < count; ++i, src += RasterImage::kChannels)
    {
        sums[0] += src[0];
        sums[1] += src[1];
        sums[2] += src[2];
    }

    std::array<double, 3> means{};
    for (int c = 0; c < 3; ++c)
        means[c] = sums[c] / static_cast<double>(count);

    const double gray = (means[0] + means[1] + means[2]) / 3.0;
    std::array<double, 3> gains{};
    for (int c = 0; c < 3; ++c)
    {
        if (means[c] < minChannelMean)
        {
            spdlog::debug("[Preprocessor] gray-world skipped: channel {} mean {:.1f}", c, means[c]);
            return out;
        }
        gains[c] = gray / means[c];
        if (gains[c] > maxGain || gains[c] < 1.0 / maxGain)
        {
            spdlog::debug("[Preprocessor] gray-world skipped: gain {:.3f} on channel {}", gains[c], c);
            return out;
        }
    }

    std::uint8_t *p = out.data();
    for (size_t i = 0; i < count; ++i, p += RasterImage::kChannels)
    {
        for (int c = 0; c < 3; ++c)
            p[c] = static_cast<std::uint8_t>(std::clamp(std::lround(p[c] * gains[c]), 0L, 255L));
    }

    spdlog::debug("[Preprocessor] gray-world gains {:.3f} {:.3f} {:.3f}", gains[0], gains[1], gains[2]);
    return out;
}

PreprocessedImage Preprocessor::process(const RasterImage &decoded) const
{
    RasterImage composited = compositeOnBackground(decoded, m_options.background);
    composited = ImageOps::fitWithin(std::move(composited), m_options.analysisMaxDimension);

    RasterImage image = composited.clone();
    if (m_options.denoise)
        image = denoise(std::move(image));

    if (m_options.colorConstancy)
        image = grayWorld(image, m_options.maxGrayWorldGain, m_options.minChannelMean);

    return PreprocessedImage{std::move(composited), std::move(image)};
}
