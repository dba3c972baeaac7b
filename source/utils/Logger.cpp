#include <QtCore/QCoreApplication>
#include <QtCore/QDateTime>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QTextStream>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QDebug>

#include <cstdio>

#include "Logger.hpp"

Q_LOGGING_CATEGORY(todoCore,    "todoserver.core")
Q_LOGGING_CATEGORY(todoHttp,    "todoserver.http")
Q_LOGGING_CATEGORY(todoStorage, "todoserver.storage")

static QFile* g_logFile = nullptr;
static QMutex g_logMutex;

static void messageHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    const QString line = qFormatLogMessage(type, ctx, msg) + '\n';

    QMutexLocker lock(&g_logMutex);
    fprintf(stderr, "%s", line.toLocal8Bit().constData());

    if (g_logFile && g_logFile->isOpen()) {
        QTextStream ts(g_logFile);
        ts << line;
        ts.flush();
    }
}

static void closeLogFile() {
    if (g_logFile) {
        g_logFile->close();
        delete g_logFile;
        g_logFile = nullptr;
    }
}

void initLogging(const QString& filePath) {
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} todoserver[%{pid}] [%{type}] %{category} "
                       "(%{if-debug}%{function}:%{line}%{endif}): %{message}");

    QString resolvedPath;
    {
        QMutexLocker lock(&g_logMutex);
        closeLogFile();

        if (!filePath.isEmpty()) {
            resolvedPath = QFileInfo(filePath).absoluteFilePath();
            g_logFile = new QFile(resolvedPath);
            if (g_logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                // one marker per run, so appended sessions stay apart
                QTextStream ts(g_logFile);
                ts << "==== todoserver session pid=" << QCoreApplication::applicationPid()
                   << " started " << QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs)
                   << " ====\n";
                ts.flush();
            } else {
                delete g_logFile;
                g_logFile = nullptr;
            }
        }
    }

    qInstallMessageHandler(messageHandler);

    if (!filePath.isEmpty() && !g_logFile) {
        qWarning(todoCore) << "Failed to open log file:" << resolvedPath;
    }

    qInfo(todoCore) << "Logging initialized"
                    << (g_logFile ? QString("-> %1").arg(resolvedPath) : QString("(stderr only)"));
}

void shutdownLogging() {
    qInfo(todoCore) << "Logging stopped";
    qInstallMessageHandler(nullptr);

    QMutexLocker lock(&g_logMutex);
    closeLogFile();
}

const char* toString(QHttpServerRequest::Method m) {
    using M = QHttpServerRequest::Method;
    switch (m) {
    case M::Get: return "GET";
    case M::Post: return "POST";
    case M::Put: return "PUT";
    case M::Delete: return "DELETE";
    case M::Patch: return "PATCH";
    case M::Head: return "HEAD";
    case M::Options: return "OPTIONS";
    case M::Trace: return "TRACE";
    case M::Connect: return "CONNECT";
    default: return "UNKNOWN";
    }
}
