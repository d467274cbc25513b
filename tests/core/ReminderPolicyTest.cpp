#include <QtTest/QtTest>

#include "TestSupport.hpp"
#include "planner/core/ReminderPolicy.hpp"

using namespace planner;

namespace {
data::Task dueIn(const QString &id, qint64 secs)
{
    data::Task task;
    task.id = id;
    task.deadline = testing::referenceNow().addSecs(secs);
    return task;
}
} // namespace

class ReminderPolicyTest : public QObject
{
    Q_OBJECT

private slots:
    void windowBoundaries();
    void skipsNotifiedCompletedAndUndated();
};

void ReminderPolicyTest::windowBoundaries()
{
    const QDateTime now = testing::referenceNow();
    core::ReminderPolicy policy;
    policy.windowMinutes = 30;
    policy.gracePeriodMinutes = 60;

    QVERIFY(policy.isDue(dueIn(QStringLiteral("soon"), 10 * 60), now));
    QVERIFY(policy.isDue(dueIn(QStringLiteral("edge"), 30 * 60), now));
    QVERIFY(!policy.isDue(dueIn(QStringLiteral("far"), 31 * 60), now));
    QVERIFY(policy.isDue(dueIn(QStringLiteral("just late"), -59 * 60), now));
    QVERIFY(policy.isDue(dueIn(QStringLiteral("grace edge"), -60 * 60), now));
    QVERIFY(!policy.isDue(dueIn(QStringLiteral("too late"), -61 * 60), now));
}

void ReminderPolicyTest::skipsNotifiedCompletedAndUndated()
{
    const QDateTime now = testing::referenceNow();
    core::ReminderPolicy policy;

    auto notified = dueIn(QStringLiteral("notified"), 60);
    notified.notified = true;
    auto completed = dueIn(QStringLiteral("completed"), 60);
    completed.completed = true;
    data::Task undated;
    undated.id = QStringLiteral("undated");
    const auto open = dueIn(QStringLiteral("open"), 60);

    const auto due = policy.dueReminders({ notified, completed, undated, open }, now);
    QCOMPARE(due.size(), static_cast<std::size_t>(1));
    QCOMPARE(due.front().id, QStringLiteral("open"));
}

QTEST_GUILESS_MAIN(ReminderPolicyTest)
#include "ReminderPolicyTest.moc"
