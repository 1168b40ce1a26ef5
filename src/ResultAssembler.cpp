#include "ResultAssembler.hpp"
#include "ImageOps.hpp"

#include <QByteArray>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

ResultAssembler::ResultAssembler(const ExtractorOptions &options)
    : m_options(options)
{
}

std::string ResultAssembler::colorName(const Rgb &color, int namedTolerance)
{
    const int hi = 255 - namedTolerance;
    if (color.r >= hi && color.g >= hi && color.b >= hi)
        return "white";
    if (color.r <= namedTolerance && color.g <= namedTolerance && color.b <= namedTolerance)
        return "black";
    return std::format("#{:02X}{:02X}{:02X}", color.r, color.g, color.b);
}

std::string ResultAssembler::encodePreview(const RasterImage &image, int maxDimension)
{
    RasterImage small = ImageOps::fitWithin(image.clone(), maxDimension);

    cv::Mat bgra;
    cv::cvtColor(ImageOps::wrap(small), bgra, cv::COLOR_RGBA2BGRA);

    std::vector<uchar> png;
    if (!cv::imencode(".png", bgra, png))
        throw PipelineError(ErrorKind::DecodeError, "failed to encode preview");

    QByteArray raw(reinterpret_cast<const char *>(png.data()), static_cast<qsizetype>(png.size()));
    return "data:image/png;base64," + raw.toBase64().toStdString();
}

ExtractionResult ResultAssembler::assemble(const std::string &filename,
                                           const std::vector<ColorCluster> &clusters,
                                           const RasterImage &analyzed) const
{
    ExtractionResult result;
    result.filename = filename;

    // 多个簇可能落到同一个名字 (例如两个不同的近白色)，保留先出现的
    std::unordered_set<std::string> seen;
    for (const auto &cluster : clusters)
    {
        std::string name = colorName(cluster.color, m_options.namedTolerance);
        if (seen.insert(name).second)
            result.colors.push_back(std::move(name));
    }
    result.count = result.colors.size();
    result.preview = encodePreview(analyzed, m_options.previewMaxDimension);

    spdlog::debug("[ResultAssembler] {}: {} colors", filename, result.count);
    return result;
}
