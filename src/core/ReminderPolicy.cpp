#include "planner/core/ReminderPolicy.hpp"

namespace planner {
namespace core {

bool ReminderPolicy::isDue(const data::Task &task, const QDateTime &now) const
{
    if (task.completed || task.notified || !task.hasDeadline()) {
        return false;
    }
    const double minutesLeft = static_cast<double>(now.msecsTo(task.deadline)) / 60000.0;
    return minutesLeft <= windowMinutes && minutesLeft >= -gracePeriodMinutes;
}

std::vector<data::Task> ReminderPolicy::dueReminders(const std::vector<data::Task> &tasks, const QDateTime &now) const
{
    std::vector<data::Task> due;
    for (const auto &task : tasks) {
        if (isDue(task, now)) {
            due.push_back(task);
        }
    }
    return due;
}

} // namespace core
} // namespace planner
