#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

namespace planner {
namespace data {

class FileSnapshotStorage
{
public:
    explicit FileSnapshotStorage(QString filePath);
    ~FileSnapshotStorage() = default;

    bool exists() const;

    std::optional<QByteArray> load() const;

    void save(const QByteArray &payload) const;

private:
    QString m_filePath;
};

} // namespace data
} // namespace planner
