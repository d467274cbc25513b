#pragma once

#include <QDateTime>
#include <QString>

namespace planner {
namespace core {

class Clock;

class DateParser
{
public:
    virtual ~DateParser() = default;

    // Throws ParseError when the text is not a date expression.
    virtual QDateTime parse(const QString &text) const = 0;
};

class QtDateParser : public DateParser
{
public:
    explicit QtDateParser(const Clock &clock);

    QDateTime parse(const QString &text) const override;

private:
    QDateTime parseRelative(const QString &normalized) const;

    const Clock &m_clock;
};

} // namespace core
} // namespace planner
