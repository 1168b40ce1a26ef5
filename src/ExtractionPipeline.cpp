#include "ExtractionPipeline.hpp"
#include "FormatClassifier.hpp"
#include "PipelineError.hpp"

#include <opencv2/core.hpp>

namespace
{
void checkStop(std::stop_token stopToken)
{
    if (stopToken.stop_requested())
        throw PipelineError(ErrorKind::Cancelled, "request cancelled");
}

ErrorDescriptor describe(const std::string &filename, ErrorKind kind, const char *message)
{
    spdlog::warn("[Pipeline] {} failed: {} ({})", filename, toString(kind), message);
    return ErrorDescriptor{filename, kind, message};
}
} // namespace

ExtractionPipeline::ExtractionPipeline(const ExtractorOptions &options)
    : ExtractionPipeline(options, RasterizerChain::defaultStrategies(options))
{
}

ExtractionPipeline::ExtractionPipeline(const ExtractorOptions &options, std::vector<std::unique_ptr<ConversionStrategy>> strategies)
    : m_options(options),
      m_rasterizer(std::move(strategies), options),
      m_preprocessor(options),
      m_extractor(options),
      m_assembler(options)
{
}

ExtractionResult ExtractionPipeline::run(const std::string &filename,
                                         const std::vector<std::uint8_t> &bytes,
                                         std::stop_token stopToken) const
{
    checkStop(stopToken);

    FormatClass formatClass = FormatClassifier::classify(bytes, filename);
    if (formatClass == FormatClass::Unknown)
        throw PipelineError(ErrorKind::UnsupportedFormat, "neither content signature nor extension is recognized");

    SourceFile source(filename, bytes, formatClass);

    RasterImage decoded = m_rasterizer.rasterize(source, stopToken);
    if (decoded.isEmpty())
        throw PipelineError(ErrorKind::EmptyImage, "decoded image has no pixels");
    checkStop(stopToken);

    PreprocessedImage prepared = m_preprocessor.process(decoded);
    checkStop(stopToken);

    // 归一化图像决定归属，颜色取归一化之前的值
    std::vector<ColorCluster> clusters = m_extractor.extract(prepared.normalized, prepared.composited);
    checkStop(stopToken);

    return m_assembler.assemble(filename, clusters, prepared.composited);
}

ExtractionOutcome ExtractionPipeline::process(const std::string &filename,
                                              const std::vector<std::uint8_t> &bytes,
                                              std::stop_token stopToken) const
{
    auto start = std::chrono::steady_clock::now();
    try
    {
        ExtractionResult result = run(filename, bytes, stopToken);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        spdlog::info("[Pipeline] {}: {} colors in {} ms", filename, result.count, elapsed.count());
        return result;
    }
    catch (const PipelineError &e)
    {
        return describe(filename, e.kind(), e.what());
    }
    catch (const cv::Exception &e)
    {
        return describe(filename, ErrorKind::DecodeError, e.what());
    }
    catch (const std::invalid_argument &e)
    {
        return describe(filename, ErrorKind::DecodeError, e.what());
    }
}
