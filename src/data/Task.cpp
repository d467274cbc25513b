#include "planner/data/Task.hpp"

#include <algorithm>
#include <tuple>

namespace planner {
namespace data {

bool operator<(const OrderingKey &lhs, const OrderingKey &rhs)
{
    return std::tie(lhs.priority, lhs.deadlineMsecs) < std::tie(rhs.priority, rhs.deadlineMsecs);
}

bool operator==(const OrderingKey &lhs, const OrderingKey &rhs)
{
    return lhs.priority == rhs.priority && lhs.deadlineMsecs == rhs.deadlineMsecs;
}

void Task::recomputeOrderingKey()
{
    m_orderingKey.priority = priority;
    m_orderingKey.deadlineMsecs = deadline.isValid() ? deadline.toMSecsSinceEpoch() : OrderingKey::NoDeadline;
}

bool operator==(const Task &lhs, const Task &rhs)
{
    return lhs.id == rhs.id
        && lhs.title == rhs.title
        && lhs.description == rhs.description
        && lhs.priority == rhs.priority
        && lhs.deadline == rhs.deadline
        && lhs.createdAt == rhs.createdAt
        && lhs.completed == rhs.completed
        && lhs.progress == rhs.progress
        && lhs.dependencies == rhs.dependencies
        && lhs.tags == rhs.tags
        && lhs.estimatedEffortMinutes == rhs.estimatedEffortMinutes
        && lhs.autoAssigned == rhs.autoAssigned
        && lhs.notified == rhs.notified;
}

bool operator!=(const Task &lhs, const Task &rhs)
{
    return !(lhs == rhs);
}

int clampProgress(int value)
{
    return std::clamp(value, 0, 100);
}

} // namespace data
} // namespace planner
