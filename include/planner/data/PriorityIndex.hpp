#pragma once

#include <QHash>
#include <QString>
#include <functional>
#include <optional>
#include <queue>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {

using TaskMap = QHash<QString, Task>;

// Lazy deletion: stale entries are dropped when they reach the top.
class PriorityIndex
{
public:
    struct Entry
    {
        OrderingKey key;
        QString taskId;
    };

    void push(Task &task);
    void rebuild(TaskMap &tasks);
    void clear();

    std::optional<Task> peek(const TaskMap &tasks);
    std::optional<Task> popNext(const TaskMap &tasks);

    std::size_t size() const;
    bool isEmpty() const;

private:
    struct Later
    {
        bool operator()(const Entry &lhs, const Entry &rhs) const;
    };

    const Task *discardStale(const TaskMap &tasks);

    std::priority_queue<Entry, std::vector<Entry>, Later> m_heap;
};

} // namespace data
} // namespace planner
