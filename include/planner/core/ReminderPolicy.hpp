#pragma once

#include <QDateTime>
#include <vector>

#include "planner/data/Task.hpp"

namespace planner {
namespace core {

struct ReminderPolicy
{
    int windowMinutes = 60;
    int gracePeriodMinutes = 60;

    bool isDue(const data::Task &task, const QDateTime &now) const;
    std::vector<data::Task> dueReminders(const std::vector<data::Task> &tasks, const QDateTime &now) const;
};

} // namespace core
} // namespace planner
