#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <functional>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {

namespace fields {
constexpr auto Tasks = "tasks";
constexpr auto Id = "id";
constexpr auto Title = "title";
constexpr auto Description = "description";
constexpr auto Priority = "priority";
constexpr auto Deadline = "deadline";
constexpr auto CreatedAt = "created_at";
constexpr auto Completed = "completed";
constexpr auto Progress = "progress";
constexpr auto Dependencies = "dependencies";
constexpr auto Tags = "tags";
constexpr auto EstimatedMinutes = "estimated_minutes";
constexpr auto AutoAssigned = "auto_assigned";
constexpr auto Reminded = "reminded";
} // namespace fields

using IdFactory = std::function<QString()>;

QString formatTimestamp(const QDateTime &dt);
QDateTime parseTimestamp(const QString &value);

QJsonObject taskToJson(const Task &task);

Task taskFromJson(const QJsonObject &object, const QDateTime &now, const IdFactory &newId);

QByteArray encodeSnapshot(const std::vector<Task> &tasks);

// All-or-nothing: either every record decodes or core::FormatError is thrown.
std::vector<Task> decodeSnapshot(const QByteArray &payload, const QDateTime &now, const IdFactory &newId);

} // namespace data
} // namespace planner
