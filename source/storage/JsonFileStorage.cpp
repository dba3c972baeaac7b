#include "JsonFileStorage.hpp"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

#include "Logger.hpp"

namespace {

void setError(QString *outError, const QString &message) {
    if (outError) {
        *outError = message;
    }
}

} // END NAMESPACE

JsonFileStorage::JsonFileStorage(const QString &filePath)
    : m_filePath(filePath) {
    qInfo(todoStorage) << "JsonFileStorage ready, path:" << m_filePath;
}

std::optional<TaskList> JsonFileStorage::load(QString *outError) const {
    if (!QFileInfo::exists(m_filePath)) {
        qInfo(todoStorage) << "No file at" << m_filePath << "→ empty list";
        return TaskList{};
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        const QString message =
            QString("Cannot open %1: %2").arg(m_filePath, file.errorString());
        qCritical(todoStorage) << "load:" << message;
        setError(outError, message);
        return std::nullopt;
    }

    const QByteArray bytes = file.readAll();
    if (bytes.trimmed().isEmpty()) {
        qInfo(todoStorage) << "Empty file" << m_filePath << "→ empty list";
        return TaskList{};
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        const QString message = QString("Malformed JSON in %1 at offset %2: %3")
                                    .arg(m_filePath)
                                    .arg(parseError.offset)
                                    .arg(parseError.errorString());
        qCritical(todoStorage) << "load:" << message;
        setError(outError, message);
        return std::nullopt;
    }

    if (!doc.isArray()) {
        const QString message =
            QString("Expected a JSON array in %1").arg(m_filePath);
        qCritical(todoStorage) << "load:" << message;
        setError(outError, message);
        return std::nullopt;
    }

    QString entryError;
    auto list = TaskList::fromJson(doc.array(), &entryError);
    if (!list) {
        const QString message =
            QString("Corrupt task list in %1: %2").arg(m_filePath, entryError);
        qCritical(todoStorage) << "load:" << message;
        setError(outError, message);
        return std::nullopt;
    }

    qInfo(todoStorage) << "→" << list->size() << "tasks loaded";
    return list;
}

bool JsonFileStorage::save(const TaskList &list, QString *outError) {
    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        const QString message =
            QString("Cannot open %1 for writing: %2").arg(m_filePath, file.errorString());
        qCritical(todoStorage) << "save:" << message;
        setError(outError, message);
        return false;
    }

    const QByteArray bytes = QJsonDocument(list.toJson()).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        const QString message =
            QString("Short write to %1: %2").arg(m_filePath, file.errorString());
        qCritical(todoStorage) << "save:" << message;
        file.cancelWriting();
        setError(outError, message);
        return false;
    }

    // temp file is renamed over the target only here
    if (!file.commit()) {
        const QString message =
            QString("Cannot commit %1: %2").arg(m_filePath, file.errorString());
        qCritical(todoStorage) << "save:" << message;
        setError(outError, message);
        return false;
    }

    qInfo(todoStorage) << "→" << list.size() << "tasks saved to" << m_filePath;
    return true;
}
