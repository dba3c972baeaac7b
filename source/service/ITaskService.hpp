#ifndef TODOSERVER_SERVICE_ITASKSERVICE_HPP
#define TODOSERVER_SERVICE_ITASKSERVICE_HPP

#include <QString>
#include <QVector>

#include "Task.hpp"

enum class TaskOutcome {
    Ok,
    InvalidInput,
    NotFound,
    StorageFailure
};

const char *toString(TaskOutcome outcome);

class ITaskService {
public:
    virtual ~ITaskService() = default;

    virtual TaskOutcome getAllTasks(QVector<Task> &outTasks,
                                    QString *outError = nullptr) const = 0;
    virtual TaskOutcome getTask(int position, Task &outTask,
                                QString *outError = nullptr) const = 0;

    virtual TaskOutcome addTask(const QString &text, Task &outTask,
                                QString *outError = nullptr) = 0;
    virtual TaskOutcome completeTask(int position,
                                     QString *outError = nullptr) = 0;
    virtual TaskOutcome deleteTask(int position,
                                   QString *outError = nullptr) = 0;
};

#endif // TODOSERVER_SERVICE_ITASKSERVICE_HPP
