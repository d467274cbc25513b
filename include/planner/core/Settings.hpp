#pragma once

#include <QString>

#include "planner/core/ReminderPolicy.hpp"

class QSettings;

namespace planner {
namespace core {

struct Settings
{
    QString snapshotPath;
    int reminderWindowMinutes = 60;
    int reminderGracePeriodMinutes = 60;
    QString loggingRules;

    ReminderPolicy reminderPolicy() const;

    static Settings load(const QSettings &settings);
    void save(QSettings &settings) const;

    static QString defaultSnapshotPath();
};

} // namespace core
} // namespace planner
