#ifndef TODOSERVER_UTILS_SERVERCONFIG_HPP
#define TODOSERVER_UTILS_SERVERCONFIG_HPP

#include <QString>
#include <QStringList>
#include <optional>

struct ServerConfig {
    QString host = QStringLiteral("localhost");
    quint16 port = 8888;
    QString todoFile = QStringLiteral("todoServer.json");
    QString logFile;

    bool showHelp = false;
    bool showVersion = false;
};

// arguments[0] is the program name, as in QCoreApplication::arguments().
// On failure outError holds a message; on success with showHelp/showVersion
// set, outText holds what to print.
std::optional<ServerConfig> parseServerConfig(const QStringList &arguments,
                                              QString *outError = nullptr,
                                              QString *outText = nullptr);

#endif // TODOSERVER_UTILS_SERVERCONFIG_HPP
