#pragma once

#include <QDateTime>

namespace planner {
namespace core {

class Clock
{
public:
    virtual ~Clock() = default;

    // Current instant in UTC.
    virtual QDateTime now() const = 0;
};

class SystemClock : public Clock
{
public:
    QDateTime now() const override;
};

} // namespace core
} // namespace planner
