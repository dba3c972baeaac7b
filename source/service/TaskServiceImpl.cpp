#include "Logger.hpp"
#include "TaskServiceImpl.hpp"

#include <QMutexLocker>

namespace {

void setError(QString *outError, const QString &message) {
    if (outError) {
        *outError = message;
    }
}

QString positionNotFound(int position, int size) {
    return QString("No task at position %1 (list has %2)").arg(position).arg(size);
}

} // END NAMESPACE

const char *toString(TaskOutcome outcome) {
    switch (outcome) {
    case TaskOutcome::Ok: return "ok";
    case TaskOutcome::InvalidInput: return "invalid_input";
    case TaskOutcome::NotFound: return "not_found";
    case TaskOutcome::StorageFailure: return "storage_failure";
    }
    return "unknown";
}

TaskServiceImpl::TaskServiceImpl(std::shared_ptr<IStorage> storage)
    : m_storage(std::move(storage)) {}

// ───────────────────────────────────────────────
// Reads
// ───────────────────────────────────────────────

TaskOutcome TaskServiceImpl::getAllTasks(QVector<Task> &outTasks,
                                         QString *outError) const {
    QMutexLocker lock(&m_mutex);

    const auto list = m_storage->load(outError);
    if (!list) {
        qCritical(todoCore) << "[Server] Failed to load tasks";
        return TaskOutcome::StorageFailure;
    }

    outTasks = list->all();
    qInfo(todoCore) << "[Server] Retrieved" << outTasks.size() << "tasks";
    return TaskOutcome::Ok;
}

TaskOutcome TaskServiceImpl::getTask(int position, Task &outTask,
                                     QString *outError) const {
    QMutexLocker lock(&m_mutex);

    const auto list = m_storage->load(outError);
    if (!list) {
        qCritical(todoCore) << "[Server] Failed to load tasks";
        return TaskOutcome::StorageFailure;
    }

    const auto found = list->get(position);
    if (!found) {
        qWarning(todoCore) << "[Server] Task at position" << position << "not found";
        setError(outError, positionNotFound(position, list->size()));
        return TaskOutcome::NotFound;
    }

    outTask = *found;
    qInfo(todoCore) << "[Server] Task found:" << outTask.task;
    return TaskOutcome::Ok;
}

// ───────────────────────────────────────────────
// Mutations
// ───────────────────────────────────────────────

TaskOutcome TaskServiceImpl::addTask(const QString &text, Task &outTask,
                                     QString *outError) {
    return mutate("add", [&](TaskList &list) {
        const auto created = list.add(text);
        if (!created) {
            qWarning(todoCore) << "[Server] Attempt to add task with empty text";
            setError(outError, "Field 'task' is required and must be non-empty");
            return TaskOutcome::InvalidInput;
        }

        outTask = *created;
        qInfo(todoCore) << "[Server] Task added:" << outTask.task
                        << "(position=" << outTask.position << ")";
        return TaskOutcome::Ok;
    }, outError);
}

TaskOutcome TaskServiceImpl::completeTask(int position, QString *outError) {
    return mutate("complete", [&](TaskList &list) {
        if (!list.complete(position)) {
            qWarning(todoCore) << "[Server] Cannot complete position" << position;
            setError(outError, positionNotFound(position, list.size()));
            return TaskOutcome::NotFound;
        }

        qInfo(todoCore) << "[Server] Task completed (position=" << position << ")";
        return TaskOutcome::Ok;
    }, outError);
}

TaskOutcome TaskServiceImpl::deleteTask(int position, QString *outError) {
    return mutate("delete", [&](TaskList &list) {
        if (!list.remove(position)) {
            qWarning(todoCore) << "[Server] Cannot delete position" << position;
            setError(outError, positionNotFound(position, list.size()));
            return TaskOutcome::NotFound;
        }

        qInfo(todoCore) << "[Server] Task deleted (position=" << position
                        << "), remaining" << list.size();
        return TaskOutcome::Ok;
    }, outError);
}

TaskOutcome TaskServiceImpl::mutate(
    const char *operation,
    const std::function<TaskOutcome(TaskList &)> &change, QString *outError) {
    QMutexLocker lock(&m_mutex);

    auto list = m_storage->load(outError);
    if (!list) {
        qCritical(todoCore) << "[Server]" << operation << "aborted: load failed";
        return TaskOutcome::StorageFailure;
    }

    const TaskOutcome outcome = change(*list);
    if (outcome != TaskOutcome::Ok) {
        return outcome;
    }

    if (!m_storage->save(*list, outError)) {
        qCritical(todoCore) << "[Server]" << operation << "failed: save failed";
        return TaskOutcome::StorageFailure;
    }

    return TaskOutcome::Ok;
}
