#include "planner/core/Settings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace planner {
namespace core {

namespace {
constexpr auto SnapshotPathKey = "storage/snapshotPath";
constexpr auto ReminderWindowKey = "reminders/windowMinutes";
constexpr auto ReminderGraceKey = "reminders/gracePeriodMinutes";
constexpr auto LoggingRulesKey = "logging/rules";

int readMinutes(const QSettings &settings, const char *key, int fallback)
{
    bool ok = false;
    const int value = settings.value(QLatin1String(key), fallback).toInt(&ok);
    return ok && value >= 0 ? value : fallback;
}
} // namespace

ReminderPolicy Settings::reminderPolicy() const
{
    ReminderPolicy policy;
    policy.windowMinutes = reminderWindowMinutes;
    policy.gracePeriodMinutes = reminderGracePeriodMinutes;
    return policy;
}

Settings Settings::load(const QSettings &settings)
{
    Settings result;
    result.snapshotPath = settings.value(QLatin1String(SnapshotPathKey)).toString();
    if (result.snapshotPath.isEmpty()) {
        result.snapshotPath = defaultSnapshotPath();
    }
    result.reminderWindowMinutes = readMinutes(settings, ReminderWindowKey, result.reminderWindowMinutes);
    result.reminderGracePeriodMinutes = readMinutes(settings, ReminderGraceKey, result.reminderGracePeriodMinutes);
    result.loggingRules = settings.value(QLatin1String(LoggingRulesKey)).toString();
    return result;
}

void Settings::save(QSettings &settings) const
{
    settings.setValue(QLatin1String(SnapshotPathKey), snapshotPath);
    settings.setValue(QLatin1String(ReminderWindowKey), reminderWindowMinutes);
    settings.setValue(QLatin1String(ReminderGraceKey), reminderGracePeriodMinutes);
    settings.setValue(QLatin1String(LoggingRulesKey), loggingRules);
}

QString Settings::defaultSnapshotPath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/priority-planner");
    }
    return QDir(storageFolder).filePath(QStringLiteral("tasks.json"));
}

} // namespace core
} // namespace planner
