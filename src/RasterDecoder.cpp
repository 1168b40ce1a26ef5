#include "RasterDecoder.hpp"
#include "ImageOps.hpp"
#include "PipelineError.hpp"

#include <climits>
#include <opencv2/imgcodecs.hpp>
#include <stb_image.h>

namespace
{
struct StbiDeleter
{
    void operator()(stbi_uc *pixels) const
    {
        if (pixels)
            stbi_image_free(pixels);
    }
};
using StbiPixelsPtr = std::unique_ptr<stbi_uc, StbiDeleter>;
} // namespace

std::optional<RasterImage> RasterDecoder::decodeWithOpenCV(const std::vector<std::uint8_t> &bytes)
{
    try
    {
        cv::Mat rawData(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<void *>(static_cast<const void *>(bytes.data())));

        // IMREAD_UNCHANGED 保留 alpha 通道和原始位深
        cv::Mat decoded = cv::imdecode(rawData, cv::IMREAD_UNCHANGED | cv::IMREAD_IGNORE_ORIENTATION);
        if (decoded.empty())
            return std::nullopt;

        return ImageOps::fromDecodedMat(decoded);
    }
    catch (const cv::Exception &e)
    {
        spdlog::debug("[RasterDecoder] OpenCV decode error: {}", e.what());
        return std::nullopt;
    }
}

std::optional<RasterImage> RasterDecoder::decodeWithStb(const std::vector<std::uint8_t> &bytes, std::string &reason)
{
    int w = 0, h = 0, channelsInFile = 0;
    // 强制输出 4 通道；GIF 只解码第一帧
    StbiPixelsPtr pixels(stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()), &w, &h, &channelsInFile, 4));
    if (!pixels)
    {
        const char *why = stbi_failure_reason();
        reason = why ? why : "unknown stb_image failure";
        return std::nullopt;
    }

    size_t dataSize = static_cast<size_t>(w) * h * RasterImage::kChannels;
    std::vector<std::uint8_t> rgba(pixels.get(), pixels.get() + dataSize);
    return RasterImage(w, h, std::move(rgba));
}

RasterImage RasterDecoder::decode(const std::vector<std::uint8_t> &bytes)
{
    if (bytes.empty())
        throw PipelineError(ErrorKind::DecodeError, "file is empty");
    if (bytes.size() > static_cast<size_t>(INT_MAX))
        throw PipelineError(ErrorKind::DecodeError, "file is too large to decode");

    if (auto image = decodeWithOpenCV(bytes))
        return std::move(*image);

    std::string reason;
    if (auto image = decodeWithStb(bytes, reason))
    {
        spdlog::debug("[RasterDecoder] Decoded with stb_image fallback ({}x{})", image->width(), image->height());
        return std::move(*image);
    }

    throw PipelineError(ErrorKind::DecodeError, std::format("cannot decode raster data: {}", reason));
}
