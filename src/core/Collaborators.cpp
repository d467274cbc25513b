#include "planner/core/Clock.hpp"
#include "planner/core/IdGenerator.hpp"

#include <QUuid>

namespace planner {
namespace core {

QDateTime SystemClock::now() const
{
    return QDateTime::currentDateTimeUtc();
}

QString UuidGenerator::newId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

} // namespace core
} // namespace planner
