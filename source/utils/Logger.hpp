#ifndef TODOSERVER_UTILS_LOGGER_HPP
#define TODOSERVER_UTILS_LOGGER_HPP

#include <QtHttpServer/QHttpServerRequest>
#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

Q_DECLARE_LOGGING_CATEGORY(todoCore)
Q_DECLARE_LOGGING_CATEGORY(todoHttp)
Q_DECLARE_LOGGING_CATEGORY(todoStorage)

void initLogging(const QString& filePath = QString());
void shutdownLogging();

const char* toString(QHttpServerRequest::Method m);

#endif // TODOSERVER_UTILS_LOGGER_HPP
