#ifndef _EXTRACTION_RESULT_HPP_
#define _EXTRACTION_RESULT_HPP_

#include "PCH.h"
#include "PipelineError.hpp"

// 单个文件的提取结果，组装完成后不再修改
struct ExtractionResult
{
    std::string filename;
    // "#RRGGBB" 或 "white" / "black"，主色在前，已去重
    std::vector<std::string> colors;
    size_t count = 0;
    // data:image/png;base64,...
    std::string preview;
};

struct ErrorDescriptor
{
    std::string filename;
    ErrorKind kind = ErrorKind::DecodeError;
    std::string message;
};

using ExtractionOutcome = std::variant<ExtractionResult, ErrorDescriptor>;

inline const std::string &outcomeFilename(const ExtractionOutcome &outcome)
{
    return std::visit([](const auto &o) -> const std::string &
                      { return o.filename; },
                      outcome);
}

#endif
