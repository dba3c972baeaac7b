#ifndef TODOSERVER_MODEL_TASKLIST_HPP
#define TODOSERVER_MODEL_TASKLIST_HPP

#include <QDateTime>
#include <QJsonArray>
#include <QString>
#include <QVector>
#include <optional>

#include "Task.hpp"

// Ordered task collection addressed by 1-based position. Positions are
// re-derived from the backing order after every mutation and on load.
class TaskList {
public:
    TaskList() = default;

    std::optional<Task>
    add(const QString &text,
        const QDateTime &createdAt = QDateTime::currentDateTimeUtc());
    bool complete(int position,
                  const QDateTime &completedAt = QDateTime::currentDateTimeUtc());
    bool remove(int position);

    std::optional<Task> get(int position) const;
    const QVector<Task> &all() const { return m_tasks; }

    int size() const { return static_cast<int>(m_tasks.size()); }
    bool isEmpty() const { return m_tasks.isEmpty(); }

    QJsonArray toJson() const;
    static std::optional<TaskList> fromJson(const QJsonArray &array,
                                            QString *outError = nullptr);

private:
    bool inRange(int position) const;
    void renumber();

    QVector<Task> m_tasks;
};

#endif // TODOSERVER_MODEL_TASKLIST_HPP
