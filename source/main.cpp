#include <QCoreApplication>
#include <QtHttpServer/QHttpServer>
#include <QtHttpServer/QHttpServerResponse>
#include <QTcpServer>
#include <QHostAddress>
#include <QHostInfo>
#include <QDebug>

#include <cstdio>

#include "JsonFileStorage.hpp"
#include "Logger.hpp"
#include "ServerConfig.hpp"
#include "TaskServiceImpl.hpp"
#include "TodoRouter.hpp"

static QHostAddress resolveHost(const QString &host) {
    if (host.compare(QStringLiteral("localhost"), Qt::CaseInsensitive) == 0) {
        return QHostAddress(QHostAddress::LocalHost);
    }

    const QHostAddress literal(host);
    if (!literal.isNull()) {
        return literal;
    }

    const QHostInfo info = QHostInfo::fromName(host);
    if (info.error() != QHostInfo::NoError || info.addresses().isEmpty()) {
        return QHostAddress();
    }

    return info.addresses().constFirst();
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QString configError;
    QString configText;
    const auto config = parseServerConfig(app.arguments(), &configError, &configText);
    if (!config) {
        qCritical(todoCore) << "Invalid arguments:" << configError;
        return 1;
    }

    if (config->showHelp || config->showVersion) {
        fprintf(stdout, "%s", qPrintable(configText));
        return 0;
    }

    initLogging(config->logFile);

    QLoggingCategory::setFilterRules(
        "todoserver.*=true\n"
        "qt.network.ssl.warning=false\n"
        );

    // ──────────────────────────────
    // 1. Storage
    // ──────────────────────────────
    auto storage = std::make_shared<JsonFileStorage>(config->todoFile);

    // ──────────────────────────────
    // 2. Task service
    // ──────────────────────────────
    auto service = std::make_shared<TaskServiceImpl>(storage);

    // ──────────────────────────────
    // 3. HTTP server + routes
    // ──────────────────────────────
    QHttpServer server;

    TodoRouter router(service);
    router.registerRoutes(server);

    // ──────────────────────────────
    // 4. Bind and run
    // ──────────────────────────────
    const QHostAddress address = resolveHost(config->host);
    if (address.isNull()) {
        qCritical(todoCore) << "Cannot resolve host" << config->host;
        shutdownLogging();
        return 1;
    }

    auto tcp = new QTcpServer(&app);
    if (!tcp->listen(address, config->port) || !server.bind(tcp)) {
        qCritical(todoCore) << "Server failed to start on"
                            << config->host << config->port << ":" << tcp->errorString();
        shutdownLogging();
        return 1;
    }

    qInfo(todoCore) << "Local server starting on port" << tcp->serverPort()
                    << "| file:" << config->todoFile;

    const int rc = app.exec();
    shutdownLogging();
    return rc;
}
