#ifndef TODOSERVER_STORAGE_JSONFILESTORAGE_HPP
#define TODOSERVER_STORAGE_JSONFILESTORAGE_HPP

#include "IStorage.hpp"

// Keeps the whole task list in one JSON array on disk. A missing or empty
// file reads as an empty list; writes replace the file atomically.
class JsonFileStorage : public IStorage {
public:
    explicit JsonFileStorage(const QString &filePath);

    std::optional<TaskList> load(QString *outError = nullptr) const override;
    bool save(const TaskList &list, QString *outError = nullptr) override;

    const QString &filePath() const { return m_filePath; }

private:
    QString m_filePath;
};

#endif // TODOSERVER_STORAGE_JSONFILESTORAGE_HPP
