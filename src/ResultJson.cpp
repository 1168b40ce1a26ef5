#include "ResultJson.hpp"

#include <QJsonArray>
#include <QJsonDocument>

namespace
{
QString qs(const std::string &s)
{
    return QString::fromStdString(s);
}

QJsonObject resultObject(const ExtractionResult &result)
{
    QJsonArray colors;
    for (const auto &c : result.colors)
        colors.append(qs(c));

    QJsonObject obj;
    obj["filename"] = qs(result.filename);
    obj["count"] = static_cast<qint64>(result.count);
    obj["colors"] = colors;
    obj["preview"] = qs(result.preview);
    return obj;
}

QJsonObject errorObject(const ErrorDescriptor &error)
{
    QJsonObject obj;
    obj["filename"] = qs(error.filename);
    obj["error"] = QString::fromUtf8(toString(error.kind).data(), static_cast<qsizetype>(toString(error.kind).size()));
    obj["message"] = qs(error.message);
    return obj;
}
} // namespace

QJsonObject ResultJson::toJson(const ExtractionOutcome &outcome)
{
    if (const auto *result = std::get_if<ExtractionResult>(&outcome))
        return resultObject(*result);
    return errorObject(std::get<ErrorDescriptor>(outcome));
}

QByteArray ResultJson::envelope(const std::vector<ExtractionOutcome> &outcomes, bool indented)
{
    QJsonArray results;
    for (const auto &outcome : outcomes)
        results.append(toJson(outcome));

    QJsonObject root;
    root["results"] = results;
    return QJsonDocument(root).toJson(indented ? QJsonDocument::Indented : QJsonDocument::Compact);
}
