#include "planner/core/DateParser.hpp"

#include <QDate>
#include <QRegularExpression>
#include <limits>

#include "planner/core/Clock.hpp"
#include "planner/core/Errors.hpp"

namespace planner {
namespace core {

namespace {
constexpr qint64 SecondsPerDay = 24 * 60 * 60;

const char *const LocalFormats[] = {
    "yyyy-MM-dd HH:mm",
    "yyyy-MM-dd HH:mm:ss",
    "yyyy-MM-dd'T'HH:mm",
};
} // namespace

QtDateParser::QtDateParser(const Clock &clock)
    : m_clock(clock)
{
}

QDateTime QtDateParser::parse(const QString &text) const
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        throw ParseError(text);
    }

    const QDateTime relative = parseRelative(trimmed.toLower());
    if (relative.isValid()) {
        return relative;
    }

    QDateTime dt = QDateTime::fromString(trimmed, Qt::ISODateWithMs);
    if (dt.isValid()) {
        return dt.toUTC();
    }

    for (const char *format : LocalFormats) {
        dt = QDateTime::fromString(trimmed, QLatin1String(format));
        if (dt.isValid()) {
            return dt.toUTC();
        }
    }

    dt = QDateTime::fromString(trimmed, Qt::RFC2822Date);
    if (dt.isValid()) {
        return dt.toUTC();
    }

    const QDate date = QDate::fromString(trimmed, QStringLiteral("yyyy-MM-dd"));
    if (date.isValid()) {
        return date.startOfDay().toUTC();
    }

    throw ParseError(text);
}

QDateTime QtDateParser::parseRelative(const QString &normalized) const
{
    const QDateTime now = m_clock.now();
    if (normalized == QLatin1String("now") || normalized == QLatin1String("today")) {
        return now;
    }
    if (normalized == QLatin1String("tomorrow")) {
        return now.addDays(1);
    }

    static const QRegularExpression inPattern(QStringLiteral("^in\\s+(\\d+)\\s+(minute|min|hour|day|week)s?$"));
    const QRegularExpressionMatch match = inPattern.match(normalized);
    if (!match.hasMatch()) {
        return {};
    }

    bool ok = false;
    const qint64 amount = match.captured(1).toLongLong(&ok);
    if (!ok) {
        return {};
    }
    const QString unit = match.captured(2);
    qint64 secondsPerUnit = 7 * SecondsPerDay;
    if (unit == QLatin1String("minute") || unit == QLatin1String("min")) {
        secondsPerUnit = 60;
    } else if (unit == QLatin1String("hour")) {
        secondsPerUnit = 3600;
    } else if (unit == QLatin1String("day")) {
        secondsPerUnit = SecondsPerDay;
    }
    // The result must stay representable as milliseconds since the epoch.
    const qint64 headroomMsecs = std::numeric_limits<qint64>::max() - qMax<qint64>(now.toMSecsSinceEpoch(), 0);
    if (amount > headroomMsecs / (secondsPerUnit * 1000)) {
        return {};
    }

    const QDateTime result = secondsPerUnit % SecondsPerDay == 0 ? now.addDays(amount * (secondsPerUnit / SecondsPerDay))
                                                                 : now.addSecs(amount * secondsPerUnit);
    return result.isValid() ? result : QDateTime();
}

} // namespace core
} // namespace planner
