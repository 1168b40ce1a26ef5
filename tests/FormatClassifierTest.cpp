#include "FormatClassifier.hpp"
#include "TestImages.hpp"

#include <gtest/gtest.h>

using TestImages::bytesOf;
using namespace std::string_view_literals;

TEST(FormatClassifierTest, RecognizesRasterSignatures)
{
    auto png = TestImages::encode(TestImages::solid(2, 2, {1, 2, 3}), ".png");
    EXPECT_EQ(FormatClassifier::classify(png, "noext"), FormatClass::Raster);

    EXPECT_EQ(FormatClassifier::classify(bytesOf("\xFF\xD8\xFF\xE0garbage"), "x"), FormatClass::Raster);
    EXPECT_EQ(FormatClassifier::classify(bytesOf("GIF89a......"), "x"), FormatClass::Raster);
    EXPECT_EQ(FormatClassifier::classify(bytesOf("RIFF\x10\x00\x00\x00WEBPVP8 "sv), "x"), FormatClass::Raster);
    EXPECT_EQ(FormatClassifier::classify(bytesOf("P6\n2 2\n255\n"), "x"), FormatClass::Raster);
}

TEST(FormatClassifierTest, SignatureWinsOverExtension)
{
    auto png = TestImages::encode(TestImages::solid(2, 2, {1, 2, 3}), ".png");
    EXPECT_EQ(FormatClassifier::classify(png, "picture.svg"), FormatClass::Raster);
    EXPECT_EQ(FormatClassifier::classify(bytesOf("%PDF-1.7\n"), "drawing.png"), FormatClass::ProprietaryVector);
}

TEST(FormatClassifierTest, RecognizesPrintFormats)
{
    EXPECT_EQ(FormatClassifier::classify(bytesOf("%!PS-Adobe-3.0 EPSF-3.0\n"), "logo.eps"), FormatClass::ProprietaryVector);
    EXPECT_EQ(FormatClassifier::classify(bytesOf("%PDF-1.5\n"), "logo.ai"), FormatClass::ProprietaryVector);

    std::vector<std::uint8_t> dosEps = {0xC5, 0xD0, 0xD3, 0xC6, 0, 0, 0, 0};
    EXPECT_EQ(FormatClassifier::classify(dosEps, "x"), FormatClass::ProprietaryVector);
    EXPECT_TRUE(FormatClassifier::isDosEps(dosEps));
    EXPECT_FALSE(FormatClassifier::isPdf(dosEps));
}

TEST(FormatClassifierTest, RecognizesSvgAfterPrologAndBom)
{
    EXPECT_EQ(FormatClassifier::classify(bytesOf("<svg xmlns=\"http://www.w3.org/2000/svg\"/>"), "a"), FormatClass::SvgVector);

    std::string withProlog =
        "\xEF\xBB\xBF  <?xml version=\"1.0\"?>\n"
        "<!-- Generator: Adobe Illustrator -->\n"
        "<!DOCTYPE svg PUBLIC \"-//W3C//DTD SVG 1.1//EN\" \"http://www.w3.org/Graphics/SVG/1.1/DTD/svg11.dtd\" [\n"
        "  <!ENTITY ns_flows \"http://ns.adobe.com/Flows/1.0/\">\n"
        "]>\n"
        "<svg version=\"1.1\">";
    EXPECT_EQ(FormatClassifier::classify(bytesOf(withProlog), "upload.bin"), FormatClass::SvgVector);

    EXPECT_EQ(FormatClassifier::classify(bytesOf("<svg:svg xmlns:svg=\"http://www.w3.org/2000/svg\">"), "a"), FormatClass::SvgVector);
}

TEST(FormatClassifierTest, OtherXmlFallsBackToExtension)
{
    auto html = bytesOf("<?xml version=\"1.0\"?><html></html>");
    EXPECT_EQ(FormatClassifier::classify(html, "page.xml"), FormatClass::Unknown);
    EXPECT_EQ(FormatClassifier::classify(html, "broken.svg"), FormatClass::SvgVector);
}

TEST(FormatClassifierTest, ExtensionFallbackIsCaseInsensitive)
{
    auto junk = bytesOf("not an image at all");
    EXPECT_EQ(FormatClassifier::classify(junk, "PHOTO.JPG"), FormatClass::Raster);
    EXPECT_EQ(FormatClassifier::classify(junk, "art.Ai"), FormatClass::ProprietaryVector);
    EXPECT_EQ(FormatClassifier::classify(junk, "notes.txt"), FormatClass::Unknown);
    EXPECT_EQ(FormatClassifier::classify(junk, "README"), FormatClass::Unknown);
    EXPECT_EQ(FormatClassifier::classify({}, "empty.png"), FormatClass::Raster);
}

TEST(FormatClassifierTest, LowerExtension)
{
    EXPECT_EQ(lowerExtension("a/b/Logo.SVG"), ".svg");
    EXPECT_EQ(lowerExtension("archive.tar.GZ"), ".gz");
    EXPECT_EQ(lowerExtension("noext"), "");
}
