#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

#include "planner/data/PriorityIndex.hpp"
#include "planner/data/Task.hpp"

namespace planner {
namespace data {

// Field-level update; only engaged members are applied.
struct TaskPatch
{
    std::optional<QString> title;
    std::optional<QString> description;
    std::optional<int> priority;
    std::optional<QDateTime> deadline; // an invalid QDateTime clears the deadline
    std::optional<int> progress;
    std::optional<bool> completed;
    std::optional<QStringList> dependencies;
    std::optional<QStringList> tags;
    std::optional<std::optional<int>> estimatedEffortMinutes;
    std::optional<bool> notified;
};

class TaskStore
{
public:
    TaskStore();
    ~TaskStore();

    TaskStore(const TaskStore &) = delete;
    TaskStore &operator=(const TaskStore &) = delete;

    Task create(Task task);

    Task get(const QString &id) const;
    std::optional<Task> findById(const QString &id) const;
    bool contains(const QString &id) const;

    std::vector<Task> listAll() const;
    std::vector<Task> listActive() const;

    // Dependency gating is the caller's responsibility.
    Task update(const QString &id, const TaskPatch &patch);
    bool remove(const QString &id);

    void bulkReplace(std::vector<Task> tasks);

    std::optional<Task> peekNext();
    std::optional<Task> popNext();
    void rebuildIndex();

    std::size_t size() const;
    std::size_t indexSize() const;

private:
    std::vector<Task> sortedTasks(bool includeCompleted) const;

    TaskMap m_tasks;
    PriorityIndex m_index;
};

} // namespace data
} // namespace planner
