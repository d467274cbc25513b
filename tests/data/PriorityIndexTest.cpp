#include <QtTest/QtTest>

#include "TestSupport.hpp"
#include "planner/data/PriorityIndex.hpp"

using namespace planner;

namespace {
data::Task makeTask(const QString &id, int priority, const QDateTime &deadline = QDateTime())
{
    data::Task task;
    task.id = id;
    task.title = id;
    task.priority = priority;
    task.deadline = deadline;
    return task;
}

void addTask(data::TaskMap &tasks, data::PriorityIndex &index, data::Task task)
{
    auto it = tasks.insert(task.id, std::move(task));
    index.push(it.value());
}
} // namespace

class PriorityIndexTest : public QObject
{
    Q_OBJECT

private slots:
    void emptyIndexReturnsNothing();
    void ordersByPriorityThenDeadline();
    void tiesBreakById();
    void peekIsIdempotent();
    void skipsDeletedAndCompleted();
    void rebuildDropsCompletedAndPicksUpNewKeys();
};

void PriorityIndexTest::emptyIndexReturnsNothing()
{
    data::TaskMap tasks;
    data::PriorityIndex index;
    QVERIFY(!index.peek(tasks).has_value());
    QVERIFY(!index.popNext(tasks).has_value());
    QVERIFY(index.isEmpty());
}

void PriorityIndexTest::ordersByPriorityThenDeadline()
{
    const QDateTime now = testing::referenceNow();
    data::TaskMap tasks;
    data::PriorityIndex index;
    addTask(tasks, index, makeTask(QStringLiteral("low"), 7));
    addTask(tasks, index, makeTask(QStringLiteral("p1-none"), 1));
    addTask(tasks, index, makeTask(QStringLiteral("p1-later"), 1, now.addDays(2)));
    addTask(tasks, index, makeTask(QStringLiteral("p1-soon"), 1, now.addSecs(600)));
    addTask(tasks, index, makeTask(QStringLiteral("p3"), 3, now.addSecs(60)));

    QStringList order;
    while (const auto task = index.popNext(tasks)) {
        order << task->id;
    }
    QCOMPARE(order, (QStringList{ "p1-soon", "p1-later", "p1-none", "p3", "low" }));
}

void PriorityIndexTest::tiesBreakById()
{
    data::TaskMap tasks;
    data::PriorityIndex index;
    addTask(tasks, index, makeTask(QStringLiteral("b"), 2));
    addTask(tasks, index, makeTask(QStringLiteral("c"), 2));
    addTask(tasks, index, makeTask(QStringLiteral("a"), 2));

    QCOMPARE(index.popNext(tasks)->id, QStringLiteral("a"));
    QCOMPARE(index.popNext(tasks)->id, QStringLiteral("b"));
    QCOMPARE(index.popNext(tasks)->id, QStringLiteral("c"));
}

void PriorityIndexTest::peekIsIdempotent()
{
    data::TaskMap tasks;
    data::PriorityIndex index;
    addTask(tasks, index, makeTask(QStringLiteral("one"), 2));
    addTask(tasks, index, makeTask(QStringLiteral("two"), 4));

    QCOMPARE(index.peek(tasks)->id, QStringLiteral("one"));
    QCOMPARE(index.peek(tasks)->id, QStringLiteral("one"));
    QCOMPARE(index.size(), static_cast<std::size_t>(2));
}

void PriorityIndexTest::skipsDeletedAndCompleted()
{
    data::TaskMap tasks;
    data::PriorityIndex index;
    addTask(tasks, index, makeTask(QStringLiteral("gone"), 1));
    addTask(tasks, index, makeTask(QStringLiteral("done"), 2));
    addTask(tasks, index, makeTask(QStringLiteral("open"), 3));

    tasks.remove(QStringLiteral("gone"));
    tasks[QStringLiteral("done")].completed = true;

    // Stale entries are only discarded once they reach the top.
    QCOMPARE(index.size(), static_cast<std::size_t>(3));
    QCOMPARE(index.peek(tasks)->id, QStringLiteral("open"));
    QCOMPARE(index.size(), static_cast<std::size_t>(1));

    QCOMPARE(index.popNext(tasks)->id, QStringLiteral("open"));
    QVERIFY(!index.peek(tasks).has_value());
}

void PriorityIndexTest::rebuildDropsCompletedAndPicksUpNewKeys()
{
    data::TaskMap tasks;
    data::PriorityIndex index;
    addTask(tasks, index, makeTask(QStringLiteral("first"), 1));
    addTask(tasks, index, makeTask(QStringLiteral("second"), 5));
    addTask(tasks, index, makeTask(QStringLiteral("closed"), 0));
    tasks[QStringLiteral("closed")].completed = true;

    tasks[QStringLiteral("second")].priority = 0;
    index.rebuild(tasks);

    QCOMPARE(index.size(), static_cast<std::size_t>(2));
    QCOMPARE(tasks.value(QStringLiteral("second")).orderingKey().priority, 0);
    QCOMPARE(index.popNext(tasks)->id, QStringLiteral("second"));
    QCOMPARE(index.popNext(tasks)->id, QStringLiteral("first"));
    QVERIFY(index.isEmpty());
}

QTEST_GUILESS_MAIN(PriorityIndexTest)
#include "PriorityIndexTest.moc"
