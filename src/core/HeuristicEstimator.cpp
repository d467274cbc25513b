#include "planner/core/HeuristicEstimator.hpp"

#include <QRegularExpression>
#include <QVector>
#include <algorithm>

namespace planner {
namespace core {

namespace {
const QStringList UrgentKeywords = { QStringLiteral("urgent"), QStringLiteral("asap"), QStringLiteral("immediately") };
const QStringList HighKeywords = { QStringLiteral("high"), QStringLiteral("important") };
const QStringList LowKeywords = { QStringLiteral("low"), QStringLiteral("whenever") };

constexpr qint64 SecondsPerHour = 60 * 60;

bool containsAny(const QString &lowered, const QStringList &keywords)
{
    return std::any_of(keywords.cbegin(), keywords.cend(), [&lowered](const QString &keyword) {
        return lowered.contains(keyword);
    });
}
} // namespace

Estimate HeuristicEstimator::estimate(const QString &title, const QString &description, const QDateTime &deadline,
                                      const QDateTime &now)
{
    Estimate result;
    const QString text = QStringLiteral("%1 %2").arg(title, description).toLower();

    if (containsAny(text, UrgentKeywords)) {
        result.priority = 1;
        result.tags << QStringLiteral("urgent");
    } else if (containsAny(text, HighKeywords)) {
        result.priority = std::min(result.priority, 2);
        result.tags << QStringLiteral("high");
    } else if (containsAny(text, LowKeywords)) {
        result.priority = std::max(result.priority, 7);
        result.tags << QStringLiteral("low");
    }

    result.deadline = deadline;
    if (deadline.isValid()) {
        const qint64 remaining = now.secsTo(deadline);
        if (remaining <= 12 * SecondsPerHour) {
            result.priority = std::min(result.priority, 1);
            result.tags << QStringLiteral("due_12h");
        } else if (remaining <= 24 * SecondsPerHour) {
            result.priority = std::min(result.priority, 2);
            result.tags << QStringLiteral("due_24h");
        } else if (remaining <= 3 * 24 * SecondsPerHour) {
            result.priority = std::min(result.priority, 3);
            result.tags << QStringLiteral("due_3d");
        }
    }

    result.estimatedEffortMinutes = estimateEffortMinutes(description);
    return result;
}

int HeuristicEstimator::estimateEffortMinutes(const QString &description)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    const int words = description.split(whitespace, Qt::SkipEmptyParts).size();
    const int minutes = heuristics::MinutesPerWordBlock * (words / heuristics::WordsPerBlock + 1);
    return std::clamp(minutes, heuristics::MinEffortMinutes, heuristics::MaxEffortMinutes);
}

NaturalTextHints HeuristicEstimator::parseNaturalText(const QString &text, const QDateTime &now)
{
    NaturalTextHints hints;
    // Length is counted in code points so a surrogate pair is never split.
    const QVector<uint> codePoints = text.toUcs4();
    hints.title = codePoints.size() <= heuristics::MaxTitleLength
        ? text
        : QString::fromUcs4(codePoints.constData(), heuristics::MaxTitleLength - 3) + QStringLiteral("...");
    hints.description = text;

    const QString lowered = text.toLower();
    if (lowered.contains(QLatin1String("tomorrow"))) {
        hints.deadline = now.addDays(1);
    } else if (lowered.contains(QLatin1String("today"))) {
        hints.deadline = now;
    }
    hints.urgent = containsAny(lowered, UrgentKeywords);
    return hints;
}

} // namespace core
} // namespace planner
