#ifndef TODOSERVER_UTILS_ERRORHANDLER_HPP
#define TODOSERVER_UTILS_ERRORHANDLER_HPP

#include <QByteArray>
#include <QDateTime>
#include <QUuid>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponder>
#include <QtHttpServer/QHttpServerResponse>
#include <functional>

#include "Logger.hpp"

inline QByteArray reasonPhrase(QHttpServerResponse::StatusCode status) {
    using S = QHttpServerResponse::StatusCode;
    switch (status) {
    case S::Ok: return "OK";
    case S::Created: return "Created";
    case S::NoContent: return "No Content";
    case S::BadRequest: return "Bad Request";
    case S::NotFound: return "Not Found";
    case S::MethodNotAllowed: return "Method Not Allowed";
    case S::InternalServerError: return "Internal Server Error";
    default: return QByteArray::number(static_cast<int>(status));
    }
}

inline QHttpServerResponse makeText(const QByteArray &body,
                                    QHttpServerResponse::StatusCode status =
                                    QHttpServerResponse::StatusCode::Ok) {
    return QHttpServerResponse("text/plain; charset=utf-8", body, status);
}

// The client only sees the reason phrase; the message goes to the log.
inline QHttpServerResponse
makeApiError(QHttpServerResponse::StatusCode status, const QString &message,
             const QString &requestId = {}) {
    qWarning(todoHttp) << "[ERR]" << static_cast<int>(status) << message
                       << "| requestId=" << requestId;

    return makeText(reasonPhrase(status) + '\n', status);
}

inline QHttpServerResponse makeNoContent() {
    return QHttpServerResponse(QHttpServerResponse::StatusCode::NoContent);
}

inline void sendNotFound(QHttpServerResponder &responder,
                         const QHttpServerRequest &request) {
    const QString methodString = toString(request.method());
    const QString urlString = request.url().toString();
    qWarning(todoHttp) << "404 no route for" << methodString << urlString;

    responder.sendResponse(
        makeText(reasonPhrase(QHttpServerResponse::StatusCode::NotFound) + '\n',
                 QHttpServerResponse::StatusCode::NotFound));
}

// ─────────────────────────────────────────────────────────────────────────────
// Safe wrapper overloads with fixed signatures
// ─────────────────────────────────────────────────────────────────────────────

inline auto wrapSafe(const char *routeName,
                     std::function<QHttpServerResponse(const QString &requestId)> fn) {
    return [routeName, fn]() -> QHttpServerResponse {
        const QString requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
        const qint64 started = QDateTime::currentMSecsSinceEpoch();
        try {
            auto resp = fn(requestId);
            qInfo(todoHttp) << "[DONE]" << routeName
                            << "| requestId=" << requestId
                            << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started);
            return resp;
        } catch (const std::exception &e) {
            qCritical(todoHttp) << "[EXC]" << routeName
                                << "| requestId=" << requestId
                                << "| what=" << e.what();
            return makeApiError(QHttpServerResponse::StatusCode::InternalServerError,
                                QString::fromUtf8(e.what()), requestId);
        } catch (...) {
            qCritical(todoHttp) << "[EXC]" << routeName
                                << "| requestId=" << requestId
                                << "| unknown exception";
            return makeApiError(QHttpServerResponse::StatusCode::InternalServerError,
                                QStringLiteral("unknown exception"), requestId);
        }
    };
}

inline auto wrapSafe(const char *routeName,
                     std::function<QHttpServerResponse(const QHttpServerRequest &request,
                                                       const QString &requestId)> fn) {
    return [routeName, fn](const QHttpServerRequest &request) -> QHttpServerResponse {
        const QString requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
        const qint64 started = QDateTime::currentMSecsSinceEpoch();
        try {
            auto resp = fn(request, requestId);
            qInfo(todoHttp) << "[DONE]" << routeName
                            << "| requestId=" << requestId
                            << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started);
            return resp;
        } catch (const std::exception &e) {
            qCritical(todoHttp) << "[EXC]" << routeName
                                << "| requestId=" << requestId
                                << "| what=" << e.what();
            return makeApiError(QHttpServerResponse::StatusCode::InternalServerError,
                                QString::fromUtf8(e.what()), requestId);
        } catch (...) {
            qCritical(todoHttp) << "[EXC]" << routeName
                                << "| requestId=" << requestId
                                << "| unknown exception";
            return makeApiError(QHttpServerResponse::StatusCode::InternalServerError,
                                QStringLiteral("unknown exception"), requestId);
        }
    };
}

inline auto wrapSafe(const char *routeName,
                     std::function<QHttpServerResponse(const QString &pathArg,
                                                       const QHttpServerRequest &request,
                                                       const QString &requestId)> fn) {
    return [routeName, fn](const QString &pathArg, const QHttpServerRequest &request) -> QHttpServerResponse {
        const QString requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
        const qint64 started = QDateTime::currentMSecsSinceEpoch();
        try {
            auto resp = fn(pathArg, request, requestId);
            qInfo(todoHttp) << "[DONE]" << routeName
                            << "| requestId=" << requestId
                            << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started);
            return resp;
        } catch (const std::exception &e) {
            qCritical(todoHttp) << "[EXC]" << routeName
                                << "| requestId=" << requestId
                                << "| what=" << e.what();
            return makeApiError(QHttpServerResponse::StatusCode::InternalServerError,
                                QString::fromUtf8(e.what()), requestId);
        } catch (...) {
            qCritical(todoHttp) << "[EXC]" << routeName
                                << "| requestId=" << requestId
                                << "| unknown exception";
            return makeApiError(QHttpServerResponse::StatusCode::InternalServerError,
                                QStringLiteral("unknown exception"), requestId);
        }
    };
}

#endif // TODOSERVER_UTILS_ERRORHANDLER_HPP
