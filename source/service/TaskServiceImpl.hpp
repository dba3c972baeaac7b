#ifndef TODOSERVER_SERVICE_TASKSERVICEIMPL_HPP
#define TODOSERVER_SERVICE_TASKSERVICEIMPL_HPP

#include <QMutex>
#include <functional>
#include <memory>

#include "IStorage.hpp"
#include "ITaskService.hpp"

// Every call runs one load -> (mutate -> save) cycle against the storage
// while holding m_mutex, so concurrent writers cannot drop each other's
// changes.
class TaskServiceImpl : public ITaskService {
public:
    explicit TaskServiceImpl(std::shared_ptr<IStorage> storage);

    TaskOutcome getAllTasks(QVector<Task> &outTasks,
                            QString *outError = nullptr) const override;
    TaskOutcome getTask(int position, Task &outTask,
                        QString *outError = nullptr) const override;

    TaskOutcome addTask(const QString &text, Task &outTask,
                        QString *outError = nullptr) override;
    TaskOutcome completeTask(int position, QString *outError = nullptr) override;
    TaskOutcome deleteTask(int position, QString *outError = nullptr) override;

private:
    TaskOutcome mutate(const char *operation,
                       const std::function<TaskOutcome(TaskList &)> &change,
                       QString *outError);

    std::shared_ptr<IStorage> m_storage;
    mutable QMutex m_mutex;
};

#endif // TODOSERVER_SERVICE_TASKSERVICEIMPL_HPP
