#include "PipelineError.hpp"

std::string_view toString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::UnsupportedFormat:
        return "UnsupportedFormat";
    case ErrorKind::ConversionFailed:
        return "ConversionFailed";
    case ErrorKind::DecodeError:
        return "DecodeError";
    case ErrorKind::EmptyImage:
        return "EmptyImage";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}
