#include "ServerConfig.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDate>

static const char *kVersion = "0.0.1";

std::optional<ServerConfig> parseServerConfig(const QStringList &arguments,
                                              QString *outError,
                                              QString *outText) {
    ServerConfig config;

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QString("TODO API Server. Version %1\nCopyright %2")
            .arg(QString::fromLatin1(kVersion))
            .arg(QDate::currentDate().year()));

    // -h is taken by --host, so help is registered by hand
    const QCommandLineOption helpOption(QStringList{"?", "help"}, "Displays help on commandline options.");
    const QCommandLineOption versionOption(QStringList{"v", "version"}, "Displays version information.");
    const QCommandLineOption hostOption(QStringList{"h", "host"}, "Server host.", "host", config.host);
    const QCommandLineOption portOption(QStringList{"p", "port"}, "Server port.", "port",
                                        QString::number(config.port));
    const QCommandLineOption fileOption(QStringList{"f", "file"}, "todo JSON file.", "file",
                                        config.todoFile);
    const QCommandLineOption logOption(QStringList{"l", "log-file"},
                                       "Also append log output to this file.", "path");

    parser.addOptions({helpOption, versionOption, hostOption, portOption,
                       fileOption, logOption});

    if (!parser.parse(arguments)) {
        if (outError) {
            *outError = parser.errorText();
        }
        return std::nullopt;
    }

    if (parser.isSet(helpOption)) {
        config.showHelp = true;
        if (outText) {
            *outText = parser.helpText();
        }
        return config;
    }

    if (parser.isSet(versionOption)) {
        config.showVersion = true;
        if (outText) {
            *outText = QString("todoserver %1\n").arg(QString::fromLatin1(kVersion));
        }
        return config;
    }

    if (!parser.positionalArguments().isEmpty()) {
        if (outError) {
            *outError = QString("Unexpected argument: %1")
                            .arg(parser.positionalArguments().first());
        }
        return std::nullopt;
    }

    bool ok = false;
    const uint port = parser.value(portOption).toUInt(&ok);
    if (!ok || port == 0 || port > 65535) {
        if (outError) {
            *outError = QString("Invalid port: %1").arg(parser.value(portOption));
        }
        return std::nullopt;
    }

    config.host = parser.value(hostOption);
    config.port = static_cast<quint16>(port);
    config.todoFile = parser.value(fileOption);
    config.logFile = parser.value(logOption);

    if (config.host.isEmpty() || config.todoFile.isEmpty()) {
        if (outError) {
            *outError = QStringLiteral("Host and file must not be empty");
        }
        return std::nullopt;
    }

    return config;
}
