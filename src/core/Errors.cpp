#include "planner/core/Errors.hpp"

#include <utility>

namespace planner {
namespace core {

PlannerError::PlannerError(const QString &message)
    : std::runtime_error(message.toStdString())
{
}

NotFoundError::NotFoundError(QString taskId)
    : PlannerError(QStringLiteral("Task not found: %1").arg(taskId))
    , m_taskId(std::move(taskId))
{
}

DependencyError::DependencyError(QString taskId, QStringList unmetIds)
    : PlannerError(QStringLiteral("Unmet dependencies for %1: %2").arg(taskId, unmetIds.join(QStringLiteral(", "))))
    , m_taskId(std::move(taskId))
    , m_unmetIds(std::move(unmetIds))
{
}

ParseError::ParseError(QString text)
    : PlannerError(QStringLiteral("Cannot parse date: \"%1\"").arg(text))
    , m_text(std::move(text))
{
}

} // namespace core
} // namespace planner
