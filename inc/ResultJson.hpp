#ifndef _RESULT_JSON_HPP_
#define _RESULT_JSON_HPP_

#include "ExtractionResult.hpp"
#include "PCH.h"

#include <QJsonObject>

// 传输层使用的 JSON 信封 {"results": [...]}
namespace ResultJson
{
// 成功: filename / count / colors / preview；失败: filename / error / message
QJsonObject toJson(const ExtractionOutcome &outcome);

QByteArray envelope(const std::vector<ExtractionOutcome> &outcomes, bool indented = true);
} // namespace ResultJson

#endif
