#ifndef TODOSERVER_MODEL_TASK_HPP
#define TODOSERVER_MODEL_TASK_HPP

#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

struct Task {
    int position = 0;
    QString task;
    bool done = false;
    QDateTime createdAt;
    QDateTime completedAt;

    // position is derived from list order, so the persisted form leaves it out
    QJsonObject toJson(bool includePosition = true) const {
        QJsonObject json{{"task", task},
                         {"done", done},
                         {"created_at", createdAt.toString(Qt::ISODateWithMs)},
                         {"completed_at",
                          completedAt.isValid()
                              ? QJsonValue(completedAt.toString(Qt::ISODateWithMs))
                              : QJsonValue(QJsonValue::Null)}};

        if (includePosition) {
            json.insert("position", position);
        }

        return json;
    }

    static Task fromJson(const QJsonObject &jsonObject) {
        Task item;
        item.task = jsonObject.value("task").toString();
        item.done = jsonObject.value("done").toBool(false);
        item.createdAt = QDateTime::fromString(
            jsonObject.value("created_at").toString(), Qt::ISODate);

        const QJsonValue completed = jsonObject.value("completed_at");
        if (completed.isString()) {
            item.completedAt =
                QDateTime::fromString(completed.toString(), Qt::ISODate);
        }

        return item;
    }
};

#endif // TODOSERVER_MODEL_TASK_HPP
