#include "SourceFile.hpp"

std::string_view toString(FormatClass formatClass)
{
    switch (formatClass)
    {
    case FormatClass::Raster:
        return "raster";
    case FormatClass::SvgVector:
        return "svg";
    case FormatClass::ProprietaryVector:
        return "vector";
    case FormatClass::Unknown:
        break;
    }
    return "unknown";
}

std::string lowerExtension(const std::string &filename)
{
    std::string ext = fs::path(filename).extension().string();
    std::ranges::transform(ext, ext.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string SourceFile::extension() const
{
    return lowerExtension(m_filename);
}
