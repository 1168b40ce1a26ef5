#include "BatchProcessor.hpp"
#include "ExtractionPipeline.hpp"
#include "ExtractorOptions.hpp"
#include "PCH.h"
#include "ResultJson.hpp"

#include <QCommandLineParser>
#include <QGuiApplication>
#include <csignal>
#include <fstream>

namespace
{
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_INFRASTRUCTURE = 2;

// 信号处理中只做原子写，真正的取消由监视线程完成
std::atomic<bool> g_interrupted(false);

void handleInterrupt(int)
{
    g_interrupted.store(true);
}

struct UsageError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};
} // namespace

// =========================================================
//  Logger Initialization
// =========================================================
void initLogger(spdlog::level::level_enum level)
{
    try
    {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");

        const std::string log_file_name = "colorprobe.log";
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file_name, 1024 * 1024 * 10, 3);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        auto logger = std::make_shared<spdlog::logger>(LOG_NAME.data(), sinks.begin(), sinks.end());

        logger->set_level(level);
        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::milliseconds(100));
    }
    catch (const spdlog::spdlog_ex &ex)
    {
        std::cerr << "Global Logger initialization failed: " << ex.what() << "\n";
    }
}

// =========================================================
//  Command Line
// =========================================================
namespace
{
const QCommandLineOption kConfigOption("config", "INI file with an [extractor] group.", "file");
const QCommandLineOption kLogLevelOption("log-level", "trace, debug, info, warn, error, critical or off.", "level");
const QCommandLineOption kThreadsOption({"j", "threads"}, "Worker threads (0 = CPU count).", "n");
const QCommandLineOption kMaxClustersOption("max-clusters", "Upper bound for the initial cluster count.", "n");
const QCommandLineOption kMergeOption("merge-threshold", "RGB distance below which clusters merge.", "distance");
const QCommandLineOption kMinFractionOption("min-fraction", "Clusters smaller than this share are noise.", "fraction");
const QCommandLineOption kNoDenoiseOption("no-denoise", "Disable the bilateral denoise step.");
const QCommandLineOption kNoConstancyOption("no-color-constancy", "Disable gray-world normalization.");
const QCommandLineOption kGhostscriptOption("ghostscript", "Ghostscript executable.", "path");
const QCommandLineOption kTimeoutOption("timeout", "Per-attempt conversion timeout in milliseconds.", "ms");
const QCommandLineOption kPreviewOption("preview-size", "Longest edge of the preview image.", "px");
const QCommandLineOption kCompactOption("compact", "Print compact JSON.");

template <typename T>
void applyNumber(const QCommandLineParser &parser, const QCommandLineOption &option, T &target)
{
    if (!parser.isSet(option))
        return;

    bool ok = false;
    const QString raw = parser.value(option);
    if constexpr (std::is_floating_point_v<T>)
        target = static_cast<T>(raw.toDouble(&ok));
    else
        target = static_cast<T>(raw.toLongLong(&ok));

    if (!ok)
        throw UsageError(std::format("--{} expects a number, got \"{}\"", option.names().constLast().toStdString(), raw.toStdString()));
}

ExtractorOptions buildOptions(const QCommandLineParser &parser)
{
    ExtractorOptions options;
    try
    {
        if (parser.isSet(kConfigOption))
            options.loadFromIni(parser.value(kConfigOption).toStdString());
    }
    catch (const std::invalid_argument &e)
    {
        throw UsageError(e.what());
    }

    if (parser.isSet(kThreadsOption))
    {
        long long threads = 0;
        applyNumber(parser, kThreadsOption, threads);
        if (threads < 0)
            throw UsageError("--threads must not be negative");
        options.workerThreads = static_cast<unsigned>(threads);
    }
    applyNumber(parser, kMaxClustersOption, options.maxClusters);
    applyNumber(parser, kMergeOption, options.mergeThreshold);
    applyNumber(parser, kMinFractionOption, options.minClusterFraction);
    applyNumber(parser, kTimeoutOption, options.conversionTimeoutMs);
    applyNumber(parser, kPreviewOption, options.previewMaxDimension);
    if (parser.isSet(kNoDenoiseOption))
        options.denoise = false;
    if (parser.isSet(kNoConstancyOption))
        options.colorConstancy = false;
    if (parser.isSet(kGhostscriptOption))
        options.ghostscriptPath = parser.value(kGhostscriptOption).toStdString();

    try
    {
        options.validate();
    }
    catch (const std::invalid_argument &e)
    {
        throw UsageError(e.what());
    }
    return options;
}

std::vector<InputFile> readInputs(const QStringList &paths)
{
    std::vector<InputFile> files;
    files.reserve(static_cast<size_t>(paths.size()));
    for (const auto &qPath : paths)
    {
        fs::path path(qPath.toStdString());
        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw UsageError(std::format("cannot open {}", path.string()));

        InputFile file;
        file.filename = path.filename().string();
        file.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        files.push_back(std::move(file));
    }
    return files;
}

spdlog::level::level_enum logLevelFrom(const QCommandLineParser &parser)
{
    spdlog::level::level_enum level = spdlog::level::warn;
#ifdef DEBUG
    level = spdlog::level::debug;
#endif
    if (!parser.isSet(kLogLevelOption))
        return level;

    try
    {
        return parseLogLevel(parser.value(kLogLevelOption).toStdString());
    }
    catch (const std::invalid_argument &e)
    {
        throw UsageError(e.what());
    }
}
} // namespace

// =========================================================
//  Main Entry Point
// =========================================================
int main(int argc, char *argv[])
{
    // 只做离屏渲染 (SVG / PDF)，不需要窗口系统
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
        qputenv("QT_QPA_PLATFORM", "offscreen");

    QGuiApplication app(argc, argv);
    app.setApplicationName("colorprobe");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Extract the dominant colors of raster, SVG, EPS, AI and PDF files.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({kConfigOption, kLogLevelOption, kThreadsOption, kMaxClustersOption, kMergeOption,
                       kMinFractionOption, kNoDenoiseOption, kNoConstancyOption, kGhostscriptOption,
                       kTimeoutOption, kPreviewOption, kCompactOption});
    parser.addPositionalArgument("files", "Image files to analyze.", "<files...>");
    parser.process(app);

    int ret = 0;
    try
    {
        initLogger(logLevelFrom(parser));

        ExtractorOptions options = buildOptions(parser);

        const QStringList paths = parser.positionalArguments();
        if (paths.isEmpty())
            throw UsageError("no input files");
        if (static_cast<size_t>(paths.size()) > options.maxBatchSize)
            throw UsageError(std::format("too many files: {} (limit {})", paths.size(), options.maxBatchSize));

        std::vector<InputFile> files = readInputs(paths);

        ExtractionPipeline pipeline(options);
        BatchProcessor batch(pipeline, options.workerThreads);

        std::stop_source cancel;
        std::signal(SIGINT, handleInterrupt);
        std::signal(SIGTERM, handleInterrupt);
        std::jthread watcher([&cancel](std::stop_token token)
                             {
            while (!token.stop_requested())
            {
                if (g_interrupted.load())
                {
                    spdlog::warn("Interrupted, cancelling remaining files...");
                    cancel.request_stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            } });

        std::vector<ExtractionOutcome> outcomes = batch.processBatch(files, cancel.get_token());
        watcher.request_stop();

        std::cout << ResultJson::envelope(outcomes, !parser.isSet(kCompactOption)).toStdString() << std::flush;

        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
    }
    catch (const UsageError &e)
    {
        spdlog::error("{}", e.what());
        std::cerr << "colorprobe: " << e.what() << "\n"
                  << "Try 'colorprobe --help' for more information.\n";
        ret = EXIT_USAGE;
    }
    catch (const std::bad_alloc &)
    {
        spdlog::critical("Out of memory, batch aborted");
        ret = EXIT_INFRASTRUCTURE;
    }
    catch (const std::exception &e)
    {
        spdlog::critical("Batch aborted: {}", e.what());
        ret = EXIT_INFRASTRUCTURE;
    }

    spdlog::drop_all();
    spdlog::shutdown();
    return ret;
}
