#include "planner/data/PriorityIndex.hpp"

namespace planner {
namespace data {

bool PriorityIndex::Later::operator()(const Entry &lhs, const Entry &rhs) const
{
    if (lhs.key == rhs.key) {
        return lhs.taskId > rhs.taskId;
    }
    return rhs.key < lhs.key;
}

void PriorityIndex::push(Task &task)
{
    task.recomputeOrderingKey();
    m_heap.push(Entry{ task.orderingKey(), task.id });
}

void PriorityIndex::rebuild(TaskMap &tasks)
{
    clear();
    std::vector<Entry> entries;
    entries.reserve(static_cast<size_t>(tasks.size()));
    for (auto it = tasks.begin(); it != tasks.end(); ++it) {
        Task &task = it.value();
        if (task.completed) {
            continue;
        }
        task.recomputeOrderingKey();
        entries.push_back(Entry{ task.orderingKey(), task.id });
    }
    m_heap = decltype(m_heap)(Later{}, std::move(entries));
}

void PriorityIndex::clear()
{
    m_heap = decltype(m_heap)();
}

const Task *PriorityIndex::discardStale(const TaskMap &tasks)
{
    while (!m_heap.empty()) {
        const auto it = tasks.constFind(m_heap.top().taskId);
        if (it == tasks.constEnd() || it->completed) {
            m_heap.pop();
            continue;
        }
        return &it.value();
    }
    return nullptr;
}

std::optional<Task> PriorityIndex::peek(const TaskMap &tasks)
{
    const Task *task = discardStale(tasks);
    if (!task) {
        return std::nullopt;
    }
    return *task;
}

std::optional<Task> PriorityIndex::popNext(const TaskMap &tasks)
{
    const Task *task = discardStale(tasks);
    if (!task) {
        return std::nullopt;
    }
    Task result = *task;
    m_heap.pop();
    return result;
}

std::size_t PriorityIndex::size() const
{
    return m_heap.size();
}

bool PriorityIndex::isEmpty() const
{
    return m_heap.empty();
}

} // namespace data
} // namespace planner
