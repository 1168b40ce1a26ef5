#include "EmbeddedPreviewStrategy.hpp"
#include "FormatClassifier.hpp"
#include "PipelineError.hpp"
#include "RasterDecoder.hpp"

namespace
{
// DOS EPS 头: magic(4) ps_offset ps_len wmf_offset wmf_len tiff_offset tiff_len checksum(2)
constexpr size_t K_DOS_EPS_HEADER_SIZE = 30;
constexpr size_t K_TIFF_OFFSET_FIELD = 20;
constexpr size_t K_TIFF_LENGTH_FIELD = 24;

std::uint32_t readLE32(const std::vector<std::uint8_t> &bytes, size_t offset)
{
    return static_cast<std::uint32_t>(bytes[offset]) |
           (static_cast<std::uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<std::uint32_t>(bytes[offset + 2]) << 16) |
           (static_cast<std::uint32_t>(bytes[offset + 3]) << 24);
}
} // namespace

bool EmbeddedPreviewStrategy::accepts(const SourceFile &file) const
{
    return FormatClassifier::isDosEps(file.bytes());
}

RasterImage EmbeddedPreviewStrategy::convert(const SourceFile &file, const ConversionBudget &budget) const
{
    if (budget.stopToken.stop_requested())
        throw PipelineError(ErrorKind::Cancelled, "conversion cancelled");

    const auto &bytes = file.bytes();
    if (bytes.size() < K_DOS_EPS_HEADER_SIZE)
        throw PipelineError(ErrorKind::ConversionFailed, "truncated DOS EPS header");

    const size_t tiffOffset = readLE32(bytes, K_TIFF_OFFSET_FIELD);
    const size_t tiffLength = readLE32(bytes, K_TIFF_LENGTH_FIELD);
    if (tiffOffset == 0 || tiffLength == 0)
        throw PipelineError(ErrorKind::ConversionFailed, "DOS EPS file carries no TIFF preview");
    if (tiffOffset > bytes.size() || tiffLength > bytes.size() - tiffOffset)
        throw PipelineError(ErrorKind::ConversionFailed, "TIFF preview lies outside the file");

    std::vector<std::uint8_t> preview(bytes.begin() + tiffOffset, bytes.begin() + tiffOffset + tiffLength);
    spdlog::debug("[EmbeddedPreview] {}: TIFF preview {} bytes at offset {}", file.filename(), tiffLength, tiffOffset);
    return RasterDecoder::decode(preview);
}
