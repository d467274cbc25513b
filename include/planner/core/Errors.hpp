#pragma once

#include <QString>
#include <QStringList>
#include <stdexcept>

namespace planner {
namespace core {

class PlannerError : public std::runtime_error
{
public:
    explicit PlannerError(const QString &message);
};

class NotFoundError : public PlannerError
{
public:
    explicit NotFoundError(QString taskId);

    const QString &taskId() const { return m_taskId; }

private:
    QString m_taskId;
};

class DependencyError : public PlannerError
{
public:
    DependencyError(QString taskId, QStringList unmetIds);

    const QString &taskId() const { return m_taskId; }
    const QStringList &unmetIds() const { return m_unmetIds; }

private:
    QString m_taskId;
    QStringList m_unmetIds;
};

class ParseError : public PlannerError
{
public:
    explicit ParseError(QString text);

    const QString &text() const { return m_text; }

private:
    QString m_text;
};

class FormatError : public PlannerError
{
public:
    using PlannerError::PlannerError;
};

} // namespace core
} // namespace planner
