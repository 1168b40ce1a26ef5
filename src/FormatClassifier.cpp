#include "FormatClassifier.hpp"

namespace
{

constexpr size_t K_XML_SNIFF_WINDOW = 4096;

static const std::unordered_map<std::string, FormatClass> kExtensionClasses = {
    {".png", FormatClass::Raster},
    {".jpg", FormatClass::Raster},
    {".jpeg", FormatClass::Raster},
    {".jpe", FormatClass::Raster},
    {".gif", FormatClass::Raster},
    {".bmp", FormatClass::Raster},
    {".dib", FormatClass::Raster},
    {".tif", FormatClass::Raster},
    {".tiff", FormatClass::Raster},
    {".webp", FormatClass::Raster},
    {".ico", FormatClass::Raster},
    {".pbm", FormatClass::Raster},
    {".pgm", FormatClass::Raster},
    {".ppm", FormatClass::Raster},
    {".pnm", FormatClass::Raster},
    {".svg", FormatClass::SvgVector},
    {".ai", FormatClass::ProprietaryVector},
    {".eps", FormatClass::ProprietaryVector},
    {".epsf", FormatClass::ProprietaryVector},
    {".ps", FormatClass::ProprietaryVector},
    {".pdf", FormatClass::ProprietaryVector}};

std::string_view asView(const std::vector<std::uint8_t> &bytes, size_t limit = std::string_view::npos)
{
    size_t len = std::min(bytes.size(), limit);
    return std::string_view(reinterpret_cast<const char *>(bytes.data()), len);
}

bool isXmlSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

size_t skipSpace(std::string_view text, size_t pos)
{
    while (pos < text.size() && isXmlSpace(text[pos]))
        ++pos;
    return pos;
}

// 跳过 <!DOCTYPE ...>，内部子集 [...] 里可能出现 '>'
size_t skipDoctype(std::string_view text, size_t pos)
{
    int bracketDepth = 0;
    for (; pos < text.size(); ++pos)
    {
        char c = text[pos];
        if (c == '[')
            ++bracketDepth;
        else if (c == ']')
            --bracketDepth;
        else if (c == '>' && bracketDepth <= 0)
            return pos + 1;
    }
    return std::string_view::npos;
}

// 在 XML 前导部分之后找到根元素名。找不到时返回空串
std::string_view findRootElement(std::string_view text)
{
    size_t pos = 0;
    while (true)
    {
        pos = skipSpace(text, pos);
        if (pos >= text.size() || text[pos] != '<')
            return {};

        std::string_view rest = text.substr(pos);
        if (rest.starts_with("<?"))
        {
            size_t end = text.find("?>", pos);
            if (end == std::string_view::npos)
                return {};
            pos = end + 2;
        }
        else if (rest.starts_with("<!--"))
        {
            size_t end = text.find("-->", pos);
            if (end == std::string_view::npos)
                return {};
            pos = end + 3;
        }
        else if (rest.starts_with("<!"))
        {
            pos = skipDoctype(text, pos);
            if (pos == std::string_view::npos)
                return {};
        }
        else
        {
            size_t nameStart = pos + 1;
            size_t nameEnd = nameStart;
            while (nameEnd < text.size() && !isXmlSpace(text[nameEnd]) && text[nameEnd] != '>' && text[nameEnd] != '/')
                ++nameEnd;
            return text.substr(nameStart, nameEnd - nameStart);
        }
    }
}

bool hasRasterSignature(std::string_view head)
{
    if (head.starts_with("\x89PNG\r\n\x1a\n"))
        return true;
    if (head.starts_with("\xFF\xD8\xFF"))
        return true;
    if (head.starts_with("GIF87a") || head.starts_with("GIF89a"))
        return true;
    if (head.starts_with("BM") && head.size() >= 14)
        return true;
    if (head.starts_with(std::string_view("II*\0", 4)) || head.starts_with(std::string_view("MM\0*", 4)))
        return true;
    if (head.size() >= 12 && head.starts_with("RIFF") && head.substr(8, 4) == "WEBP")
        return true;
    if (head.starts_with(std::string_view("\0\0\1\0", 4)))
        return true;
    if (head.size() >= 3 && head[0] == 'P' && head[1] >= '1' && head[1] <= '6' && isXmlSpace(head[2]))
        return true;
    return false;
}

} // namespace

bool FormatClassifier::isDosEps(const std::vector<std::uint8_t> &bytes)
{
    return asView(bytes, 4) == std::string_view("\xC5\xD0\xD3\xC6", 4);
}

bool FormatClassifier::isPdf(const std::vector<std::uint8_t> &bytes)
{
    return asView(bytes, 5) == "%PDF-";
}

bool FormatClassifier::isPostScript(const std::vector<std::uint8_t> &bytes)
{
    return asView(bytes, 4) == "%!PS";
}

std::optional<FormatClass> FormatClassifier::classifySignature(const std::vector<std::uint8_t> &bytes)
{
    if (bytes.empty())
        return std::nullopt;

    std::string_view head = asView(bytes, 64);
    if (hasRasterSignature(head))
        return FormatClass::Raster;

    if (isPdf(bytes) || isPostScript(bytes) || isDosEps(bytes))
        return FormatClass::ProprietaryVector;

    // SVG：可选 BOM + 空白，之后是 <svg 或 XML 前导
    std::string_view text = asView(bytes, K_XML_SNIFF_WINDOW);
    if (text.starts_with("\xEF\xBB\xBF"))
        text.remove_prefix(3);
    text.remove_prefix(std::min(skipSpace(text, 0), text.size()));

    if (!text.starts_with("<"))
        return std::nullopt;

    std::string_view root = findRootElement(text);
    if (root == "svg" || root.ends_with(":svg"))
        return FormatClass::SvgVector;

    // 其他 XML 文档：签名不明确，交给扩展名
    return std::nullopt;
}

FormatClass FormatClassifier::classifyExtension(const std::string &filename)
{
    auto it = kExtensionClasses.find(lowerExtension(filename));
    if (it == kExtensionClasses.end())
        return FormatClass::Unknown;
    return it->second;
}

FormatClass FormatClassifier::classify(const std::vector<std::uint8_t> &bytes, const std::string &filename)
{
    if (auto bySignature = classifySignature(bytes))
    {
        spdlog::debug("[Classifier] {} -> {} (signature)", filename, toString(*bySignature));
        return *bySignature;
    }

    FormatClass byExtension = classifyExtension(filename);
    spdlog::debug("[Classifier] {} -> {} (extension)", filename, toString(byExtension));
    return byExtension;
}
