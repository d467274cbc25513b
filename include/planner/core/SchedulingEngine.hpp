#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <optional>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {
class TaskStore;
struct TaskPatch;
}

namespace core {

class Clock;
class DateParser;
class IdGenerator;
struct ReminderPolicy;

struct TaskDraft
{
    QString title;
    QString description;
    QString deadlineText;
    std::optional<int> priority;
    QStringList dependencies;
    QStringList tags;
    std::optional<int> estimatedEffortMinutes;
    bool useNaturalLanguageAssist = false;
};

class SchedulingEngine
{
public:
    SchedulingEngine(data::TaskStore &store, const Clock &clock, const DateParser &dateParser,
                     IdGenerator &idGenerator);

    data::Task createTask(TaskDraft draft);

    // Unknown keys are ignored. A null or empty deadline clears it.
    data::Task updateTask(const QString &id, const QVariantMap &fields);

    // No-op when the id is unknown.
    void deleteTask(const QString &id);

    data::Task setProgress(const QString &id, int value);
    data::Task completeTask(const QString &id);

    QStringList unmetDependencies(const QString &id) const;

    std::optional<data::Task> peekNext();
    std::optional<data::Task> popNext();

    QStringList globalSchedule() const;
    static double scheduleScore(const data::Task &task, const QDateTime &now);

    void markReminded(const QString &id);
    std::vector<data::Task> pendingReminders(const ReminderPolicy &policy) const;

    data::Task getTask(const QString &id) const;
    std::vector<data::Task> listTasks(bool includeCompleted = true) const;

    QByteArray exportSnapshot() const;
    void importSnapshot(const QByteArray &payload);

private:
    void requireDependenciesMet(const data::Task &task) const;
    QStringList unmetDependenciesOf(const data::Task &task) const;
    data::TaskPatch patchFromFields(const QVariantMap &fields) const;

    data::TaskStore &m_store;
    const Clock &m_clock;
    const DateParser &m_dateParser;
    IdGenerator &m_idGenerator;
};

} // namespace core
} // namespace planner
