#include "ColorExtractor.hpp"
#include "PipelineError.hpp"
#include "TestImages.hpp"

#include <gtest/gtest.h>

namespace
{
size_t totalMembers(const std::vector<ColorCluster> &clusters)
{
    size_t total = 0;
    for (const auto &c : clusters)
        total += c.pixelCount;
    return total;
}

// 四种颜色按不同面积分布的条纹图
RasterImage stripes()
{
    const std::array<Rgb, 4> palette = {Rgb{240, 240, 240}, Rgb{200, 30, 30}, Rgb{30, 60, 200}, Rgb{30, 160, 60}};
    const std::array<int, 4> widths = {40, 30, 20, 10};

    std::vector<TestImages::Rgba> pixels;
    for (int y = 0; y < 20; ++y)
        for (size_t band = 0; band < palette.size(); ++band)
            for (int x = 0; x < widths[band]; ++x)
                pixels.push_back({palette[band].r, palette[band].g, palette[band].b, 255});
    return TestImages::fromPixels(100, 20, pixels);
}
} // namespace

TEST(ColorExtractorTest, TwoByTwoOrdersByCountThenScanOrder)
{
    auto image = TestImages::fromPixels(2, 2, {{255, 0, 0, 255}, {255, 0, 0, 255}, {0, 255, 0, 255}, {0, 0, 255, 255}});
    auto clusters = ColorExtractor(ExtractorOptions{}).extract(image);

    ASSERT_EQ(clusters.size(), 3u);
    EXPECT_EQ(clusters[0].color, (Rgb{255, 0, 0}));
    EXPECT_EQ(clusters[0].pixelCount, 2u);
    EXPECT_EQ(clusters[1].color, (Rgb{0, 255, 0}));
    EXPECT_EQ(clusters[1].pixelCount, 1u);
    EXPECT_EQ(clusters[2].color, (Rgb{0, 0, 255}));
    EXPECT_EQ(clusters[2].pixelCount, 1u);

    for (size_t i = 0; i < clusters.size(); ++i)
        EXPECT_EQ(clusters[i].id, static_cast<int>(i));
}

TEST(ColorExtractorTest, SolidColorGivesOneExactCluster)
{
    auto clusters = ColorExtractor(ExtractorOptions{}).extract(TestImages::solid(37, 23, {17, 99, 201}));
    ASSERT_EQ(clusters.size(), 1u);
    EXPECT_EQ(clusters[0].color, (Rgb{17, 99, 201}));
    EXPECT_EQ(clusters[0].pixelCount, 37u * 23u);
}

TEST(ColorExtractorTest, FindsEachStripeColor)
{
    auto clusters = ColorExtractor(ExtractorOptions{}).extract(stripes());

    ASSERT_EQ(clusters.size(), 4u);
    EXPECT_EQ(clusters[0].color, (Rgb{240, 240, 240}));
    EXPECT_EQ(clusters[1].color, (Rgb{200, 30, 30}));
    EXPECT_EQ(clusters[2].color, (Rgb{30, 60, 200}));
    EXPECT_EQ(clusters[3].color, (Rgb{30, 160, 60}));
    EXPECT_EQ(totalMembers(clusters), 2000u);
}

TEST(ColorExtractorTest, ClustersAreSortedAndSeparated)
{
    // 平滑渐变，没有明显的峰
    std::vector<TestImages::Rgba> pixels;
    for (int y = 0; y < 64; ++y)
        for (int x = 0; x < 64; ++x)
            pixels.push_back({static_cast<std::uint8_t>(x * 4), static_cast<std::uint8_t>(y * 4), static_cast<std::uint8_t>((x + y) * 2), 255});
    auto image = TestImages::fromPixels(64, 64, pixels);

    ExtractorOptions options;
    auto clusters = ColorExtractor(options).extract(image);

    ASSERT_FALSE(clusters.empty());
    EXPECT_EQ(totalMembers(clusters), image.pixelCount());
    for (size_t i = 1; i < clusters.size(); ++i)
        EXPECT_GE(clusters[i - 1].pixelCount, clusters[i].pixelCount);

    for (size_t i = 0; i < clusters.size(); ++i)
        for (size_t j = i + 1; j < clusters.size(); ++j)
            EXPECT_GE(ColorExtractor::colorDistance(clusters[i].color, clusters[j].color), options.mergeThreshold);
}

TEST(ColorExtractorTest, LargerMergeThresholdMergesShades)
{
    auto image = TestImages::split(20, 10, {100, 100, 100}, {130, 110, 100});

    auto fine = ColorExtractor(ExtractorOptions{}).extract(image);
    EXPECT_EQ(fine.size(), 2u);

    ExtractorOptions coarse;
    coarse.mergeThreshold = 40.0;
    auto merged = ColorExtractor(coarse).extract(image);
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].pixelCount, 200u);
    EXPECT_EQ(merged[0].color, (Rgb{115, 105, 100}));
}

TEST(ColorExtractorTest, TinyClustersAreDroppedAsNoise)
{
    std::vector<TestImages::Rgba> pixels(1000, {50, 50, 200, 255});
    pixels[500] = {250, 200, 0, 255};
    auto clusters = ColorExtractor(ExtractorOptions{}).extract(TestImages::fromPixels(100, 10, pixels));

    ASSERT_EQ(clusters.size(), 1u);
    // 噪声像素并入最近的簇，不会丢失
    EXPECT_EQ(clusters[0].pixelCount, 1000u);
}

TEST(ColorExtractorTest, IsDeterministic)
{
    auto image = stripes();
    ExtractorOptions options;
    auto a = ColorExtractor(options).extract(image);
    auto b = ColorExtractor(options).extract(image);

    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i)
    {
        EXPECT_EQ(a[i].color, b[i].color);
        EXPECT_EQ(a[i].pixelCount, b[i].pixelCount);
    }
}

TEST(ColorExtractorTest, SampledLargeImageStillLabelsEveryPixel)
{
    ExtractorOptions options;
    options.maxSamples = 97;
    auto clusters = ColorExtractor(options).extract(TestImages::split(60, 50, {250, 250, 250}, {10, 10, 120}));

    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters[0].pixelCount, 1500u);
    EXPECT_EQ(clusters[1].pixelCount, 1500u);
    // 计数相同，左上角的像素先被扫描到
    EXPECT_EQ(clusters[0].color, (Rgb{250, 250, 250}));
}

TEST(ColorExtractorTest, EmptyImageThrows)
{
    try
    {
        ColorExtractor(ExtractorOptions{}).extract(RasterImage{});
        FAIL() << "expected EmptyImage";
    }
    catch (const PipelineError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::EmptyImage);
    }
}

TEST(ColorExtractorTest, ReportsReferenceColorsForAnalysisClusters)
{
    // 聚类看 analysis，报告的颜色取 reference 中同位置像素的均值
    auto analysis = TestImages::split(20, 10, {190, 190, 190}, {20, 40, 200});
    auto reference = TestImages::split(20, 10, {200, 190, 180}, {25, 45, 190});

    auto clusters = ColorExtractor(ExtractorOptions{}).extract(analysis, reference);
    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters[0].color, (Rgb{200, 190, 180}));
    EXPECT_EQ(clusters[0].pixelCount, 100u);
    EXPECT_EQ(clusters[1].color, (Rgb{25, 45, 190}));
    EXPECT_EQ(clusters[1].pixelCount, 100u);
}

TEST(ColorExtractorTest, ReferenceMeanCoversEveryMemberPixel)
{
    // analysis 中完全相同的像素，在 reference 中略有不同，报告其均值
    auto analysis = TestImages::solid(2, 1, {100, 100, 100});
    auto reference = TestImages::fromPixels(2, 1, {{110, 100, 90, 255}, {120, 100, 80, 255}});

    auto clusters = ColorExtractor(ExtractorOptions{}).extract(analysis, reference);
    ASSERT_EQ(clusters.size(), 1u);
    EXPECT_EQ(clusters[0].color, (Rgb{115, 100, 85}));
}

TEST(ColorExtractorTest, MismatchedReferenceSizeThrows)
{
    auto analysis = TestImages::solid(4, 4, {10, 20, 30});
    auto reference = TestImages::solid(4, 3, {10, 20, 30});
    EXPECT_THROW(ColorExtractor(ExtractorOptions{}).extract(analysis, reference), std::invalid_argument);
}

TEST(ColorExtractorTest, HistogramSeedsFollowPeaks)
{
    std::vector<Centroid> samples;
    for (int i = 0; i < 30; ++i)
        samples.push_back({10, 10, 10});
    for (int i = 0; i < 70; ++i)
        samples.push_back({240, 20, 20});

    auto seeds = ColorExtractor(ExtractorOptions{}).seedFromHistogram(samples);
    ASSERT_EQ(seeds.size(), 2u);
    EXPECT_DOUBLE_EQ(seeds[0].r, 240.0);
    EXPECT_DOUBLE_EQ(seeds[1].r, 10.0);
}
