#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <limits>
#include <optional>

namespace planner {
namespace data {

constexpr int DefaultPriority = 5;

// Heap ordering: priority ascending, then deadline ascending with a missing
// deadline sorting last, then id.
struct OrderingKey
{
    int priority = DefaultPriority;
    qint64 deadlineMsecs = NoDeadline;

    static constexpr qint64 NoDeadline = std::numeric_limits<qint64>::max();
};

bool operator<(const OrderingKey &lhs, const OrderingKey &rhs);
bool operator==(const OrderingKey &lhs, const OrderingKey &rhs);

struct Task
{
    QString id;
    QString title;
    QString description;
    int priority = DefaultPriority;
    QDateTime deadline;
    QDateTime createdAt;
    bool completed = false;
    int progress = 0;
    QStringList dependencies;
    QStringList tags;
    std::optional<int> estimatedEffortMinutes;
    bool autoAssigned = false;
    bool notified = false;

    bool hasDeadline() const { return deadline.isValid(); }
    const OrderingKey &orderingKey() const { return m_orderingKey; }

    void recomputeOrderingKey();

private:
    OrderingKey m_orderingKey;
};

bool operator==(const Task &lhs, const Task &rhs);
bool operator!=(const Task &lhs, const Task &rhs);

int clampProgress(int value);

} // namespace data
} // namespace planner
