#ifndef TODOSERVER_STORAGE_ISTORAGE_HPP
#define TODOSERVER_STORAGE_ISTORAGE_HPP

#include <QString>
#include <optional>

#include "TaskList.hpp"

class IStorage {
public:
    virtual ~IStorage() = default;

    virtual std::optional<TaskList> load(QString *outError = nullptr) const = 0;
    virtual bool save(const TaskList &list, QString *outError = nullptr) = 0;
};

#endif // TODOSERVER_STORAGE_ISTORAGE_HPP
