#include "planner/data/TaskStore.hpp"

#include <QSet>
#include <algorithm>

#include "planner/core/Errors.hpp"
#include "planner/core/Logging.hpp"

namespace planner {
namespace data {

TaskStore::TaskStore() = default;
TaskStore::~TaskStore() = default;

Task TaskStore::create(Task task)
{
    if (task.id.isEmpty()) {
        throw core::PlannerError(QStringLiteral("Cannot store a task without id"));
    }
    if (m_tasks.contains(task.id)) {
        throw core::PlannerError(QStringLiteral("Duplicate task id: %1").arg(task.id));
    }
    task.progress = clampProgress(task.progress);
    if (task.progress == 100) {
        task.completed = true;
    }
    auto it = m_tasks.insert(task.id, std::move(task));
    if (!it->completed) {
        m_index.push(it.value());
    }
    qCDebug(lcPlannerStore) << "created" << it->id;
    return it.value();
}

Task TaskStore::get(const QString &id) const
{
    const auto it = m_tasks.constFind(id);
    if (it == m_tasks.constEnd()) {
        throw core::NotFoundError(id);
    }
    return it.value();
}

std::optional<Task> TaskStore::findById(const QString &id) const
{
    const auto it = m_tasks.constFind(id);
    if (it == m_tasks.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool TaskStore::contains(const QString &id) const
{
    return m_tasks.contains(id);
}

std::vector<Task> TaskStore::listAll() const
{
    return sortedTasks(true);
}

std::vector<Task> TaskStore::listActive() const
{
    return sortedTasks(false);
}

Task TaskStore::update(const QString &id, const TaskPatch &patch)
{
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        throw core::NotFoundError(id);
    }

    Task &task = it.value();
    if (patch.title) {
        task.title = *patch.title;
    }
    if (patch.description) {
        task.description = *patch.description;
    }
    if (patch.priority) {
        task.priority = *patch.priority;
    }
    if (patch.deadline) {
        task.deadline = patch.deadline->isValid() ? patch.deadline->toUTC() : QDateTime();
    }
    if (patch.dependencies) {
        task.dependencies = *patch.dependencies;
    }
    if (patch.tags) {
        task.tags = *patch.tags;
    }
    if (patch.estimatedEffortMinutes) {
        task.estimatedEffortMinutes = *patch.estimatedEffortMinutes;
    }
    if (patch.notified) {
        task.notified = *patch.notified;
    }
    if (patch.progress) {
        task.progress = clampProgress(*patch.progress);
    }
    if (patch.completed && *patch.completed) {
        task.completed = true;
        task.progress = 100;
    }
    if (task.progress == 100) {
        task.completed = true;
    }
    task.recomputeOrderingKey();
    const Task result = task;

    rebuildIndex();
    qCDebug(lcPlannerStore) << "updated" << id;
    return result;
}

bool TaskStore::remove(const QString &id)
{
    const bool removed = m_tasks.remove(id) > 0;
    rebuildIndex();
    if (removed) {
        qCDebug(lcPlannerStore) << "removed" << id;
    }
    return removed;
}

void TaskStore::bulkReplace(std::vector<Task> tasks)
{
    TaskMap replacement;
    replacement.reserve(static_cast<int>(tasks.size()));
    for (Task &task : tasks) {
        if (task.id.isEmpty()) {
            throw core::PlannerError(QStringLiteral("Cannot store a task without id"));
        }
        if (replacement.contains(task.id)) {
            throw core::PlannerError(QStringLiteral("Duplicate task id: %1").arg(task.id));
        }
        task.progress = clampProgress(task.progress);
        if (task.progress == 100) {
            task.completed = true;
        }
        const QString id = task.id;
        replacement.insert(id, std::move(task));
    }
    m_tasks.swap(replacement);
    rebuildIndex();
    qCDebug(lcPlannerStore) << "replaced store contents with" << m_tasks.size() << "tasks";
}

std::optional<Task> TaskStore::peekNext()
{
    return m_index.peek(m_tasks);
}

std::optional<Task> TaskStore::popNext()
{
    return m_index.popNext(m_tasks);
}

void TaskStore::rebuildIndex()
{
    m_index.rebuild(m_tasks);
}

std::size_t TaskStore::size() const
{
    return static_cast<std::size_t>(m_tasks.size());
}

std::size_t TaskStore::indexSize() const
{
    return m_index.size();
}

std::vector<Task> TaskStore::sortedTasks(bool includeCompleted) const
{
    std::vector<Task> result;
    result.reserve(static_cast<size_t>(m_tasks.size()));
    for (const auto &task : m_tasks) {
        if (!includeCompleted && task.completed) {
            continue;
        }
        result.push_back(task);
    }
    std::sort(result.begin(), result.end(), [](const Task &lhs, const Task &rhs) {
        if (lhs.createdAt == rhs.createdAt) {
            return lhs.id < rhs.id;
        }
        return lhs.createdAt < rhs.createdAt;
    });
    return result;
}

} // namespace data
} // namespace planner
