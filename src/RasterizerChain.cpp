#include "RasterizerChain.hpp"
#include "EmbeddedPreviewStrategy.hpp"
#include "GhostscriptStrategy.hpp"
#include "ImageOps.hpp"
#include "PdfDocumentStrategy.hpp"
#include "PipelineError.hpp"
#include "RasterDecoder.hpp"
#include "SvgRasterizer.hpp"


RasterizerChain::RasterizerChain(std::vector<std::unique_ptr<ConversionStrategy>> strategies, const ExtractorOptions &options)
    : m_strategies(std::move(strategies)),
      m_vectorTargetSize(options.vectorTargetSize),
      m_maxRasterDimension(options.maxRasterDimension),
      m_timeout(options.conversionTimeoutMs)
{
}

std::vector<std::unique_ptr<ConversionStrategy>> RasterizerChain::defaultStrategies(const ExtractorOptions &options)
{
    std::vector<std::unique_ptr<ConversionStrategy>> strategies;
    strategies.push_back(std::make_unique<GhostscriptStrategy>(options.ghostscriptPath, options.ghostscriptDpi));
    strategies.push_back(std::make_unique<PdfDocumentStrategy>(options.vectorTargetSize));
    strategies.push_back(std::make_unique<EmbeddedPreviewStrategy>());
    return strategies;
}

RasterImage RasterizerChain::rasterize(const SourceFile &file, std::stop_token stopToken) const
{
    switch (file.formatClass())
    {
    case FormatClass::Raster:
        return RasterDecoder::decode(file.bytes());
    case FormatClass::SvgVector:
        return SvgRasterizer::render(file.bytes(), m_vectorTargetSize);
    case FormatClass::ProprietaryVector:
        return runStrategies(file, stopToken);
    case FormatClass::Unknown:
        break;
    }
    throw PipelineError(ErrorKind::UnsupportedFormat, std::format("unrecognized file type: {}", file.filename()));
}

RasterImage RasterizerChain::runStrategies(const SourceFile &file, std::stop_token stopToken) const
{
    ConversionBudget budget{m_timeout, stopToken};

    std::vector<std::string> failures;
    bool allTimedOut = true;

    for (const auto &strategy : m_strategies)
    {
        if (stopToken.stop_requested())
            throw PipelineError(ErrorKind::Cancelled, "conversion cancelled");

        if (!strategy->accepts(file))
        {
            spdlog::debug("[RasterizerChain] {} skipped by {}", file.filename(), strategy->name());
            continue;
        }

        try
        {
            RasterImage image = strategy->convert(file, budget);
            if (image.isEmpty())
                throw PipelineError(ErrorKind::ConversionFailed, "strategy produced an empty raster");

            spdlog::info("[RasterizerChain] {} converted by {} ({}x{})", file.filename(), strategy->name(), image.width(), image.height());
            return ImageOps::fitWithin(std::move(image), m_maxRasterDimension);
        }
        catch (const PipelineError &e)
        {
            if (e.kind() == ErrorKind::Cancelled)
                throw;
            if (e.kind() != ErrorKind::Timeout)
                allTimedOut = false;

            spdlog::warn("[RasterizerChain] {} failed with {}: {}", file.filename(), strategy->name(), e.what());
            failures.push_back(std::format("{}: {}", strategy->name(), e.what()));
        }
        catch (const std::bad_alloc &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            // cv::Exception、RasterImage 的 invalid_argument 等都只算这一个策略失败
            allTimedOut = false;
            spdlog::warn("[RasterizerChain] {} failed with {}: {}", file.filename(), strategy->name(), e.what());
            failures.push_back(std::format("{}: {}", strategy->name(), e.what()));
        }
    }

    if (failures.empty())
        throw PipelineError(ErrorKind::ConversionFailed, "no conversion strategy accepts this content");

    std::string message = "all conversion strategies failed";
    for (const auto &failure : failures)
        message += "; " + failure;

    throw PipelineError(allTimedOut ? ErrorKind::Timeout : ErrorKind::ConversionFailed, message);
}
