#include <QtTest/QtTest>

#include <QSettings>
#include <QTemporaryDir>

#include "planner/core/Settings.hpp"

using namespace planner;

class SettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void defaultsWhenEmpty();
    void saveAndLoad();
    void invalidMinutesFallBack();

private:
    QTemporaryDir m_dir;
};

void SettingsTest::defaultsWhenEmpty()
{
    QSettings ini(m_dir.filePath(QStringLiteral("empty.ini")), QSettings::IniFormat);
    const auto settings = core::Settings::load(ini);

    QCOMPARE(settings.snapshotPath, core::Settings::defaultSnapshotPath());
    QVERIFY(settings.snapshotPath.endsWith(QStringLiteral("tasks.json")));
    QCOMPARE(settings.reminderWindowMinutes, 60);
    QCOMPARE(settings.reminderGracePeriodMinutes, 60);
    QVERIFY(settings.loggingRules.isEmpty());

    const auto policy = settings.reminderPolicy();
    QCOMPARE(policy.windowMinutes, 60);
    QCOMPARE(policy.gracePeriodMinutes, 60);
}

void SettingsTest::saveAndLoad()
{
    const QString path = m_dir.filePath(QStringLiteral("roundtrip.ini"));
    core::Settings settings;
    settings.snapshotPath = m_dir.filePath(QStringLiteral("store/tasks.json"));
    settings.reminderWindowMinutes = 15;
    settings.reminderGracePeriodMinutes = 5;
    settings.loggingRules = QStringLiteral("planner.*.debug=true");
    {
        QSettings ini(path, QSettings::IniFormat);
        settings.save(ini);
    }

    QSettings ini(path, QSettings::IniFormat);
    const auto loaded = core::Settings::load(ini);
    QCOMPARE(loaded.snapshotPath, settings.snapshotPath);
    QCOMPARE(loaded.reminderWindowMinutes, 15);
    QCOMPARE(loaded.reminderGracePeriodMinutes, 5);
    QCOMPARE(loaded.loggingRules, settings.loggingRules);
    QCOMPARE(loaded.reminderPolicy().windowMinutes, 15);
}

void SettingsTest::invalidMinutesFallBack()
{
    QSettings ini(m_dir.filePath(QStringLiteral("invalid.ini")), QSettings::IniFormat);
    ini.setValue(QStringLiteral("reminders/windowMinutes"), QStringLiteral("soon"));
    ini.setValue(QStringLiteral("reminders/gracePeriodMinutes"), -5);

    const auto loaded = core::Settings::load(ini);
    QCOMPARE(loaded.reminderWindowMinutes, 60);
    QCOMPARE(loaded.reminderGracePeriodMinutes, 60);
}

QTEST_GUILESS_MAIN(SettingsTest)
#include "SettingsTest.moc"
