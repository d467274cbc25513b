#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "planner/core/Errors.hpp"
#include "planner/data/FileSnapshotStorage.hpp"

using namespace planner;

class FileSnapshotStorageTest : public QObject
{
    Q_OBJECT

private slots:
    void missingFileLoadsNothing();
    void saveCreatesDirectoryAndLoadsBack();
    void saveOverwrites();
};

void FileSnapshotStorageTest::missingFileLoadsNothing()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    data::FileSnapshotStorage storage(dir.filePath(QStringLiteral("absent.json")));
    QVERIFY(!storage.exists());
    QVERIFY(!storage.load().has_value());
}

void FileSnapshotStorageTest::saveCreatesDirectoryAndLoadsBack()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    data::FileSnapshotStorage storage(dir.filePath(QStringLiteral("nested/deeper/tasks.json")));
    storage.save(R"({"tasks": []})");

    QVERIFY(storage.exists());
    const auto payload = storage.load();
    QVERIFY(payload.has_value());
    QCOMPARE(*payload, QByteArray(R"({"tasks": []})"));
}

void FileSnapshotStorageTest::saveOverwrites()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    data::FileSnapshotStorage storage(dir.filePath(QStringLiteral("tasks.json")));
    storage.save("first");
    storage.save("second");
    QCOMPARE(*storage.load(), QByteArray("second"));
}

QTEST_GUILESS_MAIN(FileSnapshotStorageTest)
#include "FileSnapshotStorageTest.moc"
