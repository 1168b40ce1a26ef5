#include "ExtractorOptions.hpp"

#include <QFile>
#include <QTemporaryDir>
#include <gtest/gtest.h>

namespace
{
std::string writeIni(const QTemporaryDir &dir, const QByteArray &content)
{
    const QString path = dir.filePath("colorprobe.ini");
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        throw std::runtime_error("cannot write test config");
    file.write(content);
    return path.toStdString();
}
} // namespace

TEST(ExtractorOptionsTest, DefaultsAreValid)
{
    ExtractorOptions options;
    EXPECT_NO_THROW(options.validate());
    EXPECT_DOUBLE_EQ(options.mergeThreshold, 24.0);
    EXPECT_EQ(options.maxBatchSize, 100u);
    EXPECT_EQ(options.previewMaxDimension, 256);
    EXPECT_EQ(options.background, (Rgb{255, 255, 255}));
}

TEST(ExtractorOptionsTest, RejectsOutOfRangeValues)
{
    ExtractorOptions noClusters;
    noClusters.maxClusters = 0;
    EXPECT_THROW(noClusters.validate(), std::invalid_argument);

    ExtractorOptions fraction;
    fraction.minClusterFraction = 1.0;
    EXPECT_THROW(fraction.validate(), std::invalid_argument);

    ExtractorOptions merge;
    merge.mergeThreshold = -1.0;
    EXPECT_THROW(merge.validate(), std::invalid_argument);

    ExtractorOptions timeout;
    timeout.conversionTimeoutMs = 0;
    EXPECT_THROW(timeout.validate(), std::invalid_argument);
}

TEST(ExtractorOptionsTest, LoadsIniGroup)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    auto path = writeIni(dir,
                         "[extractor]\n"
                         "maxClusters=5\n"
                         "mergeThreshold=30.5\n"
                         "denoise=false\n"
                         "background=0,0,0\n"
                         "ghostscriptPath=/opt/gs/bin/gs\n"
                         "workerThreads=3\n");

    ExtractorOptions options;
    options.loadFromIni(path);

    EXPECT_EQ(options.maxClusters, 5);
    EXPECT_DOUBLE_EQ(options.mergeThreshold, 30.5);
    EXPECT_FALSE(options.denoise);
    EXPECT_EQ(options.background, (Rgb{0, 0, 0}));
    EXPECT_EQ(options.ghostscriptPath, "/opt/gs/bin/gs");
    EXPECT_EQ(options.workerThreads, 3u);
    // 未出现的键保持默认
    EXPECT_EQ(options.maxIterations, 50);
    EXPECT_TRUE(options.colorConstancy);
}

TEST(ExtractorOptionsTest, RejectsBadIniValues)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    ExtractorOptions options;
    EXPECT_THROW(options.loadFromIni(writeIni(dir, "[extractor]\nmaxIterations=lots\n")), std::invalid_argument);
    EXPECT_THROW(options.loadFromIni(writeIni(dir, "[extractor]\nbackground=1,2\n")), std::invalid_argument);
    EXPECT_THROW(options.loadFromIni(dir.filePath("missing.ini").toStdString()), std::invalid_argument);
}

TEST(ExtractorOptionsTest, ParsesKnownLogLevels)
{
    EXPECT_EQ(parseLogLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(parseLogLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
}

TEST(ExtractorOptionsTest, RejectsUnknownLogLevel)
{
    EXPECT_THROW(parseLogLevel("verbose"), std::invalid_argument);
    EXPECT_THROW(parseLogLevel(""), std::invalid_argument);
}
