#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>

namespace planner {
namespace core {

struct Estimate
{
    int priority = 5;
    QDateTime deadline;
    QStringList tags;
    int estimatedEffortMinutes = 15;
};

struct NaturalTextHints
{
    QString title;
    QString description;
    QDateTime deadline;
    bool urgent = false;
};

namespace heuristics {
constexpr int MinEffortMinutes = 15;
constexpr int MaxEffortMinutes = 80;
constexpr int MinutesPerWordBlock = 8;
constexpr int WordsPerBlock = 20;
constexpr int MaxTitleLength = 60;
} // namespace heuristics

class HeuristicEstimator
{
public:
    static Estimate estimate(const QString &title, const QString &description, const QDateTime &deadline,
                             const QDateTime &now);

    static int estimateEffortMinutes(const QString &description);

    // "tomorrow" wins over "today".
    static NaturalTextHints parseNaturalText(const QString &text, const QDateTime &now);
};

} // namespace core
} // namespace planner
