#include "GhostscriptStrategy.hpp"
#include "FormatClassifier.hpp"
#include "PipelineError.hpp"
#include "RasterDecoder.hpp"

#include <QDir>
#include <QFile>
#include <QProcess>
#include <QStringList>
#include <QTemporaryDir>

namespace
{

constexpr int K_POLL_INTERVAL_MS = 50;
constexpr int K_KILL_GRACE_MS = 2000;

// 截取 stderr 尾部用于错误信息
std::string tailOf(const QByteArray &output, qsizetype maxChars = 400)
{
    QByteArray trimmed = output.trimmed();
    if (trimmed.size() > maxChars)
        trimmed = trimmed.right(maxChars);
    return trimmed.toStdString();
}

void writeFileOrThrow(const QString &path, const std::vector<std::uint8_t> &bytes)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        throw PipelineError(ErrorKind::ConversionFailed, std::format("cannot stage input: {}", file.errorString().toStdString()));

    qint64 written = file.write(reinterpret_cast<const char *>(bytes.data()), static_cast<qint64>(bytes.size()));
    if (written != static_cast<qint64>(bytes.size()))
        throw PipelineError(ErrorKind::ConversionFailed, std::format("cannot stage input: {}", file.errorString().toStdString()));
}

std::vector<std::uint8_t> readFileOrThrow(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        throw PipelineError(ErrorKind::ConversionFailed, "ghostscript produced no output page");

    QByteArray data = file.readAll();
    if (data.isEmpty())
        throw PipelineError(ErrorKind::ConversionFailed, "ghostscript produced an empty output page");
    return std::vector<std::uint8_t>(data.begin(), data.end());
}

void killAndReap(QProcess &process)
{
    process.kill();
    process.waitForFinished(K_KILL_GRACE_MS);
}

// 在预算内等待进程结束：超时或取消时杀掉进程
void waitWithinBudget(QProcess &process, const ConversionBudget &budget)
{
    const auto deadline = std::chrono::steady_clock::now() + budget.timeout;

    while (!process.waitForFinished(K_POLL_INTERVAL_MS))
    {
        if (process.state() == QProcess::NotRunning)
            break;

        if (budget.stopToken.stop_requested())
        {
            killAndReap(process);
            throw PipelineError(ErrorKind::Cancelled, "conversion cancelled");
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            killAndReap(process);
            throw PipelineError(ErrorKind::Timeout, std::format("ghostscript exceeded {} ms", budget.timeout.count()));
        }
    }
}

} // namespace

GhostscriptStrategy::GhostscriptStrategy(std::string executable, int dpi)
    : m_executable(std::move(executable)), m_dpi(dpi)
{
}

bool GhostscriptStrategy::accepts(const SourceFile &file) const
{
    const auto &bytes = file.bytes();
    return FormatClassifier::isPostScript(bytes) || FormatClassifier::isPdf(bytes) || FormatClassifier::isDosEps(bytes);
}

std::vector<std::string> GhostscriptStrategy::buildArguments(const std::string &inputPath, const std::string &outputPath) const
{
    return {
        "-q",
        "-dSAFER",
        "-dBATCH",
        "-dNOPAUSE",
        "-dEPSCrop",
        "-dFirstPage=1",
        "-dLastPage=1",
        "-dTextAlphaBits=4",
        "-dGraphicsAlphaBits=4",
        "-sDEVICE=pngalpha",
        std::format("-r{}", m_dpi),
        "-sOutputFile=" + outputPath,
        inputPath};
}

RasterImage GhostscriptStrategy::convert(const SourceFile &file, const ConversionBudget &budget) const
{
    // 临时目录只属于这一次尝试，析构时连同内容一起删除
    QTemporaryDir workDir;
    if (!workDir.isValid())
        throw PipelineError(ErrorKind::ConversionFailed, std::format("cannot create temp dir: {}", workDir.errorString().toStdString()));

    const QString inputPath = workDir.filePath(QString::fromStdString("input" + file.extension()));
    const QString outputPath = workDir.filePath("page.png");
    writeFileOrThrow(inputPath, file.bytes());

    QStringList args;
    for (const auto &arg : buildArguments(QDir::toNativeSeparators(inputPath).toStdString(),
                                          QDir::toNativeSeparators(outputPath).toStdString()))
        args << QString::fromStdString(arg);

    QProcess process;
    process.setProcessChannelMode(QProcess::SeparateChannels);
    process.start(QString::fromStdString(m_executable), args);
    if (!process.waitForStarted(static_cast<int>(std::min<long long>(budget.timeout.count(), 5000))))
        throw PipelineError(ErrorKind::ConversionFailed, std::format("cannot start {}: {}", m_executable, process.errorString().toStdString()));

    spdlog::debug("[Ghostscript] Rendering {} (pid {})", file.filename(), process.processId());
    waitWithinBudget(process, budget);

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0)
    {
        throw PipelineError(ErrorKind::ConversionFailed,
                            std::format("ghostscript exited with code {}: {}", process.exitCode(), tailOf(process.readAllStandardError())));
    }

    return RasterDecoder::decode(readFileOrThrow(outputPath));
}
