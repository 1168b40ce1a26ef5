#include "ExtractorOptions.hpp"

#include <QFileInfo>
#include <QSettings>
#include <QString>
#include <type_traits>
#include <QStringList>

namespace
{

Rgb parseRgb(const QString &text)
{
    QStringList parts = text.split(',', Qt::SkipEmptyParts);
    if (parts.size() != 3)
        throw std::invalid_argument(std::format("background must be \"r,g,b\", got \"{}\"", text.toStdString()));

    std::array<std::uint8_t, 3> channels{};
    for (int i = 0; i < 3; ++i)
    {
        bool ok = false;
        int v = parts[i].trimmed().toInt(&ok);
        if (!ok || v < 0 || v > 255)
            throw std::invalid_argument(std::format("background channel out of range: \"{}\"", parts[i].toStdString()));
        channels[i] = static_cast<std::uint8_t>(v);
    }
    return Rgb{channels[0], channels[1], channels[2]};
}

template <typename T>
void readNumber(const QSettings &settings, const char *key, T &target)
{
    if (!settings.contains(key))
        return;

    bool ok = false;
    QString raw = settings.value(key).toString();
    if constexpr (std::is_floating_point_v<T>)
        target = static_cast<T>(raw.toDouble(&ok));
    else if constexpr (std::is_unsigned_v<T>)
        target = static_cast<T>(raw.toULongLong(&ok));
    else
        target = static_cast<T>(raw.toLongLong(&ok));

    if (!ok)
        throw std::invalid_argument(std::format("config key '{}' is not a number: \"{}\"", key, raw.toStdString()));
}

void readBool(const QSettings &settings, const char *key, bool &target)
{
    if (settings.contains(key))
        target = settings.value(key).toBool();
}

} // namespace

void ExtractorOptions::validate() const
{
    if (maxClusters < 1)
        throw std::invalid_argument("maxClusters must be >= 1");
    if (maxIterations < 1)
        throw std::invalid_argument("maxIterations must be >= 1");
    if (!(mergeThreshold >= 0.0))
        throw std::invalid_argument("mergeThreshold must be >= 0");
    if (!(minClusterFraction >= 0.0 && minClusterFraction < 1.0))
        throw std::invalid_argument("minClusterFraction must be in [0, 1)");
    if (namedTolerance < 0 || namedTolerance > 127)
        throw std::invalid_argument("namedTolerance must be in [0, 127]");
    if (maxSamples == 0)
        throw std::invalid_argument("maxSamples must be > 0");
    if (analysisMaxDimension < 1 || vectorTargetSize < 1 || maxRasterDimension < 1 || previewMaxDimension < 1)
        throw std::invalid_argument("image dimensions must be > 0");
    if (!(maxGrayWorldGain >= 1.0))
        throw std::invalid_argument("maxGrayWorldGain must be >= 1");
    if (!(minChannelMean >= 0.0 && minChannelMean <= 255.0))
        throw std::invalid_argument("minChannelMean must be in [0, 255]");
    if (ghostscriptDpi < 1)
        throw std::invalid_argument("ghostscriptDpi must be > 0");
    if (conversionTimeoutMs < 1)
        throw std::invalid_argument("conversionTimeoutMs must be > 0");
    if (maxBatchSize == 0)
        throw std::invalid_argument("maxBatchSize must be > 0");
}

void ExtractorOptions::loadFromIni(const std::string &path)
{
    QString qPath = QString::fromStdString(path);
    if (!QFileInfo(qPath).isReadable())
        throw std::invalid_argument(std::format("config file is not readable: {}", path));

    QSettings settings(qPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError)
        throw std::invalid_argument(std::format("config file is malformed: {}", path));

    settings.beginGroup("extractor");

    readNumber(settings, "maxClusters", maxClusters);
    readNumber(settings, "maxIterations", maxIterations);
    readNumber(settings, "mergeThreshold", mergeThreshold);
    readNumber(settings, "minClusterFraction", minClusterFraction);
    readNumber(settings, "namedTolerance", namedTolerance);
    readNumber(settings, "maxSamples", maxSamples);

    readNumber(settings, "analysisMaxDimension", analysisMaxDimension);
    readBool(settings, "denoise", denoise);
    readBool(settings, "colorConstancy", colorConstancy);
    readNumber(settings, "maxGrayWorldGain", maxGrayWorldGain);
    readNumber(settings, "minChannelMean", minChannelMean);
    if (settings.contains("background"))
        background = parseRgb(settings.value("background").toStringList().join(','));

    readNumber(settings, "vectorTargetSize", vectorTargetSize);
    readNumber(settings, "maxRasterDimension", maxRasterDimension);
    readNumber(settings, "ghostscriptDpi", ghostscriptDpi);
    if (settings.contains("ghostscriptPath"))
        ghostscriptPath = settings.value("ghostscriptPath").toString().toStdString();
    readNumber(settings, "conversionTimeoutMs", conversionTimeoutMs);

    readNumber(settings, "previewMaxDimension", previewMaxDimension);
    readNumber(settings, "workerThreads", workerThreads);
    readNumber(settings, "maxBatchSize", maxBatchSize);

    settings.endGroup();

    spdlog::info("[Options] Loaded configuration from {}", path);
}

spdlog::level::level_enum parseLogLevel(const std::string &name)
{
    // from_str 对不认识的名字返回 off，要和真正的 "off" 区分开
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off")
        throw std::invalid_argument(std::format("unknown log level: \"{}\"", name));
    return level;
}
