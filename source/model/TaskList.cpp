#include "TaskList.hpp"

#include <QJsonObject>

std::optional<Task> TaskList::add(const QString &text,
                                  const QDateTime &createdAt) {
    if (text.isEmpty()) {
        return std::nullopt;
    }

    Task item;
    item.task = text;
    item.done = false;
    item.createdAt = createdAt;

    m_tasks.push_back(item);
    renumber();

    return m_tasks.last();
}

bool TaskList::complete(int position, const QDateTime &completedAt) {
    if (!inRange(position)) {
        return false;
    }

    Task &item = m_tasks[position - 1];
    item.done = true;
    item.completedAt = completedAt;

    return true;
}

bool TaskList::remove(int position) {
    if (!inRange(position)) {
        return false;
    }

    m_tasks.removeAt(position - 1);
    renumber();

    return true;
}

std::optional<Task> TaskList::get(int position) const {
    if (!inRange(position)) {
        return std::nullopt;
    }

    return m_tasks.at(position - 1);
}

QJsonArray TaskList::toJson() const {
    QJsonArray array;
    for (const Task &item : m_tasks) {
        array.append(item.toJson(false));
    }

    return array;
}

std::optional<TaskList> TaskList::fromJson(const QJsonArray &array,
                                           QString *outError) {
    TaskList list;
    list.m_tasks.reserve(array.size());

    for (qsizetype i = 0; i < array.size(); ++i) {
        const QJsonValue value = array.at(i);
        if (!value.isObject() || !value.toObject().value("task").isString()) {
            if (outError) {
                *outError = QString("Entry %1 is not a task object").arg(i);
            }

            return std::nullopt;
        }

        list.m_tasks.push_back(Task::fromJson(value.toObject()));
    }

    list.renumber();

    return list;
}

bool TaskList::inRange(int position) const {
    return position >= 1 && position <= m_tasks.size();
}

void TaskList::renumber() {
    for (int i = 0; i < m_tasks.size(); ++i) {
        m_tasks[i].position = i + 1;
    }
}
