#include "ImageOps.hpp"
#include "PipelineError.hpp"

#include <QImage>
#include <opencv2/imgproc.hpp>

namespace ImageOps
{

RasterImage fromDecodedMat(const cv::Mat &decoded)
{
    if (decoded.empty())
        throw PipelineError(ErrorKind::DecodeError, "decoder produced no pixels");

    cv::Mat eightBit;
    switch (decoded.depth())
    {
    case CV_8U:
        eightBit = decoded;
        break;
    case CV_16U:
        decoded.convertTo(eightBit, CV_8U, 1.0 / 257.0);
        break;
    case CV_32F:
    case CV_64F:
        decoded.convertTo(eightBit, CV_8U, 255.0);
        break;
    default:
        throw PipelineError(ErrorKind::DecodeError, std::format("unsupported sample depth {}", decoded.depth()));
    }

    // 统一转为 RGBA
    cv::Mat rgba;
    switch (eightBit.channels())
    {
    case 1:
        cv::cvtColor(eightBit, rgba, cv::COLOR_GRAY2RGBA);
        break;
    case 3:
        cv::cvtColor(eightBit, rgba, cv::COLOR_BGR2RGBA);
        break;
    case 4:
        cv::cvtColor(eightBit, rgba, cv::COLOR_BGRA2RGBA);
        break;
    default:
        throw PipelineError(ErrorKind::DecodeError, std::format("unsupported channel count {}", eightBit.channels()));
    }

    return fromRgbaMat(rgba);
}

cv::Mat wrap(const RasterImage &image)
{
    return cv::Mat(image.height(), image.width(), CV_8UC4, const_cast<std::uint8_t *>(image.data()));
}

RasterImage fromRgbaMat(const cv::Mat &rgba)
{
    cv::Mat continuous = rgba.isContinuous() ? rgba : rgba.clone();

    size_t dataSize = continuous.total() * continuous.elemSize();
    std::vector<std::uint8_t> pixels(dataSize);
    if (dataSize > 0)
        std::memcpy(pixels.data(), continuous.data, dataSize);

    return RasterImage(continuous.cols, continuous.rows, std::move(pixels));
}

RasterImage fromQImage(const QImage &image)
{
    if (image.isNull())
        return RasterImage();

    // 非预乘 RGBA，逐行复制以去掉 bytesPerLine 对齐
    QImage rgba = image.convertToFormat(QImage::Format_RGBA8888);
    const int w = rgba.width();
    const int h = rgba.height();
    const size_t rowBytes = static_cast<size_t>(w) * RasterImage::kChannels;

    std::vector<std::uint8_t> pixels(rowBytes * h);
    for (int y = 0; y < h; ++y)
        std::memcpy(pixels.data() + y * rowBytes, rgba.constScanLine(y), rowBytes);

    return RasterImage(w, h, std::move(pixels));
}

RasterImage fitWithin(RasterImage image, int maxDimension)
{
    const int longest = std::max(image.width(), image.height());
    if (image.isEmpty() || longest <= maxDimension)
        return image;

    const double scale = static_cast<double>(maxDimension) / longest;
    const int w = std::max(1, static_cast<int>(std::lround(image.width() * scale)));
    const int h = std::max(1, static_cast<int>(std::lround(image.height() * scale)));

    cv::Mat resized;
    cv::resize(wrap(image), resized, cv::Size(w, h), 0, 0, cv::INTER_AREA);
    return fromRgbaMat(resized);
}

} // namespace ImageOps
