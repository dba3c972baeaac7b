#include <QJsonObject>
#include <QUrlQuery>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponse>

#include "ErrorHandler.hpp"
#include "JsonUtils.hpp"
#include "Logger.hpp"
#include "Task.hpp"
#include "TodoRouter.hpp"

using StatusCode = QHttpServerResponse::StatusCode;

TodoRouter::TodoRouter(std::shared_ptr<ITaskService> service)
    : m_service(std::move(service)) {}

static StatusCode statusFor(TaskOutcome outcome) {
    switch (outcome) {
    case TaskOutcome::Ok: return StatusCode::Ok;
    case TaskOutcome::InvalidInput: return StatusCode::BadRequest;
    case TaskOutcome::NotFound: return StatusCode::NotFound;
    case TaskOutcome::StorageFailure: return StatusCode::InternalServerError;
    }
    return StatusCode::InternalServerError;
}

static QHttpServerResponse outcomeError(TaskOutcome outcome,
                                        const QString &detail,
                                        const QString &requestId) {
    return makeApiError(statusFor(outcome),
                        QString("%1: %2").arg(QString::fromLatin1(toString(outcome)), detail),
                        requestId);
}

static bool parsePosition(const QString &pathArg, int &outPosition) {
    bool ok = false;
    const int position = pathArg.toInt(&ok);
    if (!ok) {
        return false;
    }

    outPosition = position;
    return true;
}

void TodoRouter::registerRoutes(QHttpServer &server) {
    const auto mirrorRoute = [&server](const char *path,
                                       QHttpServerRequest::Methods methods,
                                       auto handler) {
        server.route(path, methods, handler);
        QString withSlash = QString::fromLatin1(path);
        if (!withSlash.endsWith('/')) {
            withSlash.append('/');
        }

        server.route(withSlash.toLatin1().constData(), methods, handler);
    };

    // ─────────────────────────────────────────────────────────────────────────────
    // GET /
    // ─────────────────────────────────────────────────────────────────────────────
    server.route(
        "/", QHttpServerRequest::Method::Get,
        wrapSafe("GET /",
                 std::function<QHttpServerResponse(const QString &)>(
                     [](const QString &requestId) {
                         qInfo(todoHttp) << "[GET] /"
                                         << "| requestId=" << requestId;

                         return makeText("There's an API here\n");
                     })));

    // ─────────────────────────────────────────────────────────────────────────────
    // GET /todo
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute(
        "/todo", QHttpServerRequest::Method::Get,
        wrapSafe("GET /todo",
                 std::function<QHttpServerResponse(const QHttpServerRequest &,
                                                   const QString &)>(
                     [this](const QHttpServerRequest &request,
                            const QString &requestId) {
                         qInfo(todoHttp) << "[GET] /todo"
                                         << "url:" << request.url().toString()
                                         << "| requestId=" << requestId;

                         QVector<Task> tasks;
                         QString error;
                         const TaskOutcome outcome =
                             m_service->getAllTasks(tasks, &error);
                         if (outcome != TaskOutcome::Ok) {
                             return outcomeError(outcome, error, requestId);
                         }

                         return makeJson(makeEnvelope(tasks));
                     })));

    // ─────────────────────────────────────────────────────────────────────────────
    // POST /todo
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute(
        "/todo", QHttpServerRequest::Method::Post,
        wrapSafe(
            "POST /todo",
            std::function<QHttpServerResponse(
                const QHttpServerRequest &,
                const QString &)>([this](const QHttpServerRequest &request,
                                         const QString &requestId) {
                qInfo(todoHttp) << "[POST] /todo"
                                << "bytes=" << request.body().size()
                                << "| requestId=" << requestId;

                QString parseError;
                const auto body = parseBodyObject(request, &parseError);
                if (!body) {
                    return makeApiError(StatusCode::BadRequest,
                                        "Invalid JSON: " + parseError,
                                        requestId);
                }

                const QJsonValue taskValue = body->value("task");
                if (!taskValue.isString()) {
                    return makeApiError(StatusCode::BadRequest,
                                        "Field 'task' must be a string",
                                        requestId);
                }

                Task created;
                QString error;
                const TaskOutcome outcome =
                    m_service->addTask(taskValue.toString(), created, &error);
                if (outcome != TaskOutcome::Ok) {
                    return outcomeError(outcome, error, requestId);
                }

                return makeJson(makeEnvelope({created}), StatusCode::Created);
            })));

    // ─────────────────────────────────────────────────────────────────────────────
    // GET /todo/<position>
    // ─────────────────────────────────────────────────────────────────────────────
    server.route(
        "/todo/<arg>", QHttpServerRequest::Method::Get,
        wrapSafe(
            "GET /todo/<position>",
            std::function<QHttpServerResponse(const QString &,
                                              const QHttpServerRequest &,
                                              const QString &)>(
                [this](const QString &pathArg, const QHttpServerRequest &request,
                       const QString &requestId) {
                    qInfo(todoHttp) << "[GET] /todo/" + pathArg
                                    << "url:" << request.url().toString()
                                    << "| requestId=" << requestId;

                    int position = 0;
                    if (!parsePosition(pathArg, position)) {
                        return makeApiError(StatusCode::BadRequest,
                                            "Invalid position: " + pathArg,
                                            requestId);
                    }

                    Task found;
                    QString error;
                    const TaskOutcome outcome =
                        m_service->getTask(position, found, &error);
                    if (outcome != TaskOutcome::Ok) {
                        return outcomeError(outcome, error, requestId);
                    }

                    return makeJson(makeEnvelope({found}));
                })));

    // ─────────────────────────────────────────────────────────────────────────────
    // PATCH /todo/<position>?complete
    // ─────────────────────────────────────────────────────────────────────────────
    server.route(
        "/todo/<arg>", QHttpServerRequest::Method::Patch,
        wrapSafe(
            "PATCH /todo/<position>",
            std::function<QHttpServerResponse(const QString &,
                                              const QHttpServerRequest &,
                                              const QString &)>(
                [this](const QString &pathArg, const QHttpServerRequest &request,
                       const QString &requestId) {
                    qInfo(todoHttp) << "[PATCH] /todo/" + pathArg
                                    << "query:" << request.query().toString()
                                    << "| requestId=" << requestId;

                    int position = 0;
                    if (!parsePosition(pathArg, position)) {
                        return makeApiError(StatusCode::BadRequest,
                                            "Invalid position: " + pathArg,
                                            requestId);
                    }

                    if (!request.query().hasQueryItem(QStringLiteral("complete"))) {
                        return makeApiError(StatusCode::BadRequest,
                                            "Missing query param 'complete'",
                                            requestId);
                    }

                    QString error;
                    const TaskOutcome outcome =
                        m_service->completeTask(position, &error);
                    if (outcome != TaskOutcome::Ok) {
                        return outcomeError(outcome, error, requestId);
                    }

                    return makeNoContent();
                })));

    // ─────────────────────────────────────────────────────────────────────────────
    // DELETE /todo/<position>
    // ─────────────────────────────────────────────────────────────────────────────
    server.route(
        "/todo/<arg>", QHttpServerRequest::Method::Delete,
        wrapSafe(
            "DELETE /todo/<position>",
            std::function<QHttpServerResponse(const QString &,
                                              const QHttpServerRequest &,
                                              const QString &)>(
                [this](const QString &pathArg, const QHttpServerRequest &request,
                       const QString &requestId) {
                    qInfo(todoHttp) << "[DELETE] /todo/" + pathArg
                                    << "url:" << request.url().toString()
                                    << "| requestId=" << requestId;

                    int position = 0;
                    if (!parsePosition(pathArg, position)) {
                        return makeApiError(StatusCode::BadRequest,
                                            "Invalid position: " + pathArg,
                                            requestId);
                    }

                    QString error;
                    const TaskOutcome outcome =
                        m_service->deleteTask(position, &error);
                    if (outcome != TaskOutcome::Ok) {
                        return outcomeError(outcome, error, requestId);
                    }

                    return makeNoContent();
                })));

    // ─────────────────────────────────────────────────────────────────────────────
    // Known paths, unsupported methods
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute(
        "/todo",
        QHttpServerRequest::Methods(QHttpServerRequest::Method::Put) |
            QHttpServerRequest::Method::Patch |
            QHttpServerRequest::Method::Delete,
        wrapSafe("* /todo",
                 std::function<QHttpServerResponse(const QHttpServerRequest &,
                                                   const QString &)>(
                     [](const QHttpServerRequest &request,
                        const QString &requestId) {
                         return makeApiError(
                             StatusCode::MethodNotAllowed,
                             QString("Method %1 not allowed on /todo")
                                 .arg(QString::fromLatin1(toString(request.method()))),
                             requestId);
                     })));

    server.route(
        "/todo/<arg>",
        QHttpServerRequest::Methods(QHttpServerRequest::Method::Post) |
            QHttpServerRequest::Method::Put,
        wrapSafe("* /todo/<position>",
                 std::function<QHttpServerResponse(const QString &,
                                                   const QHttpServerRequest &,
                                                   const QString &)>(
                     [](const QString &pathArg, const QHttpServerRequest &request,
                        const QString &requestId) {
                         return makeApiError(
                             StatusCode::MethodNotAllowed,
                             QString("Method %1 not allowed on /todo/%2")
                                 .arg(QString::fromLatin1(toString(request.method())), pathArg),
                             requestId);
                     })));

    // ─────────────────────────────────────────────────────────────────────────────
    // 404 fallback
    // ─────────────────────────────────────────────────────────────────────────────
    server.setMissingHandler(&server, [](const QHttpServerRequest &request,
                                         QHttpServerResponder &responder) {
        sendNotFound(responder, request);
    });
}
