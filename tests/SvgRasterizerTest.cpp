#include "PipelineError.hpp"
#include "SvgRasterizer.hpp"
#include "TestImages.hpp"

#include <gtest/gtest.h>

TEST(SvgRasterizerTest, ScalesLongestEdgeToTarget)
{
    auto svg = TestImages::bytesOf(
        "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"100\" height=\"50\" viewBox=\"0 0 100 50\">"
        "<rect x=\"0\" y=\"0\" width=\"100\" height=\"50\" fill=\"#FF0000\"/>"
        "</svg>");

    RasterImage image = SvgRasterizer::render(svg, 200);
    EXPECT_EQ(image.width(), 200);
    EXPECT_EQ(image.height(), 100);
    EXPECT_EQ(TestImages::pixelAt(image, 100, 50), (Rgb{255, 0, 0}));
    EXPECT_EQ(TestImages::alphaAt(image, 100, 50), 255);
}

TEST(SvgRasterizerTest, UncoveredAreaStaysTransparent)
{
    auto svg = TestImages::bytesOf(
        "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 10 10\">"
        "<rect x=\"0\" y=\"0\" width=\"5\" height=\"10\" fill=\"#0000FF\"/>"
        "</svg>");

    RasterImage image = SvgRasterizer::render(svg, 100);
    ASSERT_EQ(image.width(), 100);
    ASSERT_EQ(image.height(), 100);
    EXPECT_EQ(TestImages::pixelAt(image, 10, 50), (Rgb{0, 0, 255}));
    EXPECT_EQ(TestImages::alphaAt(image, 90, 50), 0);
}

TEST(SvgRasterizerTest, UnparseableSvgIsDecodeError)
{
    try
    {
        SvgRasterizer::render(TestImages::bytesOf("<svg><rect"), 64);
        FAIL() << "expected DecodeError";
    }
    catch (const PipelineError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::DecodeError);
    }
}
