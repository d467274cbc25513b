#include "planner/data/FileSnapshotStorage.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <utility>

#include "planner/core/Errors.hpp"
#include "planner/core/Logging.hpp"

namespace planner {
namespace data {

FileSnapshotStorage::FileSnapshotStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

bool FileSnapshotStorage::exists() const
{
    return QFileInfo::exists(m_filePath);
}

std::optional<QByteArray> FileSnapshotStorage::load() const
{
    QFile file(m_filePath);
    if (!file.exists()) {
        qCDebug(lcPlannerStorage) << "no snapshot at" << m_filePath;
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcPlannerStorage) << "cannot open" << m_filePath << file.errorString();
        throw core::PlannerError(QStringLiteral("Cannot read %1: %2").arg(m_filePath, file.errorString()));
    }
    const QByteArray payload = file.readAll();
    qCDebug(lcPlannerStorage) << "loaded" << payload.size() << "bytes from" << m_filePath;
    return payload;
}

void FileSnapshotStorage::save(const QByteArray &payload) const
{
    if (m_filePath.isEmpty()) {
        throw core::PlannerError(QStringLiteral("No snapshot path configured"));
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        throw core::PlannerError(QStringLiteral("Cannot create directory %1").arg(dir.path()));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcPlannerStorage) << "cannot open" << m_filePath << "for writing:" << file.errorString();
        throw core::PlannerError(QStringLiteral("Cannot write %1: %2").arg(m_filePath, file.errorString()));
    }
    if (file.write(payload) != payload.size() || !file.commit()) {
        qCWarning(lcPlannerStorage) << "writing" << m_filePath << "failed:" << file.errorString();
        throw core::PlannerError(QStringLiteral("Cannot write %1: %2").arg(m_filePath, file.errorString()));
    }
    qCDebug(lcPlannerStorage) << "saved" << payload.size() << "bytes to" << m_filePath;
}

} // namespace data
} // namespace planner
