#include "planner/data/TaskJson.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSet>
#include <cmath>
#include <limits>

#include "planner/core/Errors.hpp"

namespace planner {
namespace data {

namespace {

[[noreturn]] void fail(const QString &message)
{
    throw core::FormatError(message);
}

QJsonArray toArray(const QStringList &values)
{
    QJsonArray array;
    for (const QString &value : values) {
        array.append(value);
    }
    return array;
}

QString readString(const QJsonObject &object, const char *key, const QString &fallback)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return fallback;
    }
    if (!value.isString()) {
        fail(QStringLiteral("Field '%1' must be a string").arg(QLatin1String(key)));
    }
    return value.toString();
}

bool readBool(const QJsonObject &object, const char *key, bool fallback)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return fallback;
    }
    if (!value.isBool()) {
        fail(QStringLiteral("Field '%1' must be a boolean").arg(QLatin1String(key)));
    }
    return value.toBool();
}

std::optional<int> readInt(const QJsonObject &object, const char *key)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return std::nullopt;
    }
    const double number = value.toDouble(std::nan(""));
    if (!value.isDouble() || std::trunc(number) != number) {
        fail(QStringLiteral("Field '%1' must be an integer").arg(QLatin1String(key)));
    }
    if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
        fail(QStringLiteral("Field '%1' is out of range: %2").arg(QLatin1String(key)).arg(number));
    }
    return static_cast<int>(number);
}

QStringList readStringList(const QJsonObject &object, const char *key)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return {};
    }
    if (!value.isArray()) {
        fail(QStringLiteral("Field '%1' must be an array").arg(QLatin1String(key)));
    }
    QStringList result;
    for (const QJsonValue &entry : value.toArray()) {
        if (!entry.isString()) {
            fail(QStringLiteral("Field '%1' must only contain strings").arg(QLatin1String(key)));
        }
        result << entry.toString();
    }
    return result;
}

QDateTime readTimestamp(const QJsonObject &object, const char *key)
{
    const QString text = readString(object, key, QString());
    if (text.isEmpty()) {
        return {};
    }
    const QDateTime dt = parseTimestamp(text);
    if (!dt.isValid()) {
        fail(QStringLiteral("Field '%1' is not a valid timestamp: %2").arg(QLatin1String(key), text));
    }
    return dt;
}

} // namespace

QString formatTimestamp(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime parseTimestamp(const QString &value)
{
    QDateTime dt = QDateTime::fromString(value.trimmed(), Qt::ISODateWithMs);
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC();
}

QJsonObject taskToJson(const Task &task)
{
    QJsonObject object;
    object.insert(fields::Id, task.id);
    object.insert(fields::Title, task.title);
    object.insert(fields::Description, task.description);
    object.insert(fields::Priority, task.priority);
    object.insert(fields::Deadline, task.hasDeadline() ? QJsonValue(formatTimestamp(task.deadline)) : QJsonValue());
    object.insert(fields::CreatedAt, formatTimestamp(task.createdAt));
    object.insert(fields::Completed, task.completed);
    object.insert(fields::Progress, task.progress);
    object.insert(fields::Dependencies, toArray(task.dependencies));
    object.insert(fields::Tags, toArray(task.tags));
    object.insert(fields::EstimatedMinutes,
                  task.estimatedEffortMinutes ? QJsonValue(*task.estimatedEffortMinutes) : QJsonValue());
    object.insert(fields::AutoAssigned, task.autoAssigned);
    object.insert(fields::Reminded, task.notified);
    return object;
}

Task taskFromJson(const QJsonObject &object, const QDateTime &now, const IdFactory &newId)
{
    Task task;
    task.id = readString(object, fields::Id, QString());
    if (task.id.isEmpty()) {
        task.id = newId();
    }
    task.title = readString(object, fields::Title, QString());
    task.description = readString(object, fields::Description, QString());
    task.priority = readInt(object, fields::Priority).value_or(DefaultPriority);
    task.deadline = readTimestamp(object, fields::Deadline);
    task.createdAt = readTimestamp(object, fields::CreatedAt);
    if (!task.createdAt.isValid()) {
        task.createdAt = now;
    }
    task.completed = readBool(object, fields::Completed, false);
    task.progress = clampProgress(readInt(object, fields::Progress).value_or(0));
    if (task.progress == 100) {
        task.completed = true;
    }
    task.dependencies = readStringList(object, fields::Dependencies);
    task.tags = readStringList(object, fields::Tags);
    task.estimatedEffortMinutes = readInt(object, fields::EstimatedMinutes);
    task.autoAssigned = readBool(object, fields::AutoAssigned, false);
    task.notified = readBool(object, fields::Reminded, false);
    task.recomputeOrderingKey();
    return task;
}

QByteArray encodeSnapshot(const std::vector<Task> &tasks)
{
    QJsonArray array;
    for (const Task &task : tasks) {
        array.append(taskToJson(task));
    }
    QJsonObject root;
    root.insert(fields::Tasks, array);
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

std::vector<Task> decodeSnapshot(const QByteArray &payload, const QDateTime &now, const IdFactory &newId)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        fail(QStringLiteral("Invalid snapshot JSON at offset %1: %2").arg(parseError.offset).arg(parseError.errorString()));
    }
    if (!document.isObject()) {
        fail(QStringLiteral("Snapshot root must be an object"));
    }

    const QJsonValue tasksValue = document.object().value(QLatin1String(fields::Tasks));
    if (tasksValue.isUndefined()) {
        return {};
    }
    if (!tasksValue.isArray()) {
        fail(QStringLiteral("Snapshot field 'tasks' must be an array"));
    }

    const QJsonArray array = tasksValue.toArray();
    std::vector<Task> tasks;
    tasks.reserve(static_cast<size_t>(array.size()));
    QSet<QString> seen;
    for (const QJsonValue &entry : array) {
        if (!entry.isObject()) {
            fail(QStringLiteral("Snapshot task records must be objects"));
        }
        Task task = taskFromJson(entry.toObject(), now, newId);
        if (seen.contains(task.id)) {
            fail(QStringLiteral("Duplicate task id in snapshot: %1").arg(task.id));
        }
        seen.insert(task.id);
        tasks.push_back(std::move(task));
    }
    return tasks;
}

} // namespace data
} // namespace planner
