#ifndef TODOSERVER_UTILS_JSONUTILS_HPP
#define TODOSERVER_UTILS_JSONUTILS_HPP

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QVector>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponse>
#include <optional>

#include "Task.hpp"

inline QHttpServerResponse makeJson(const QJsonObject &obj,
                                    QHttpServerResponse::StatusCode status =
                                    QHttpServerResponse::StatusCode::Ok) {
    return QHttpServerResponse(
        "application/json", QJsonDocument(obj).toJson(QJsonDocument::Compact),
        status);
}

// {"results": [...], "date": <unix seconds>, "total_results": n}
inline QJsonObject makeEnvelope(const QVector<Task> &tasks) {
    QJsonArray results;
    for (const Task &item : tasks) {
        results.append(item.toJson());
    }

    return QJsonObject{{"results", results},
                       {"date", QDateTime::currentSecsSinceEpoch()},
                       {"total_results", results.size()}};
}

inline std::optional<QJsonObject>
parseBodyObject(const QHttpServerRequest &request,
                QString *outError = nullptr) {
    QJsonParseError parseError{};
    const QJsonDocument doc =
        QJsonDocument::fromJson(request.body(), &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        if (outError) {
            *outError = parseError.errorString();
        }

        return std::nullopt;
    }

    if (!doc.isObject()) {
        if (outError) {
            *outError = QStringLiteral("expected a JSON object");
        }

        return std::nullopt;
    }

    return doc.object();
}

#endif // TODOSERVER_UTILS_JSONUTILS_HPP
