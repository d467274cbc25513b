#include "planner/core/SchedulingEngine.hpp"

#include <QMetaType>
#include <algorithm>
#include <limits>
#include <utility>

#include "planner/core/Clock.hpp"
#include "planner/core/DateParser.hpp"
#include "planner/core/Errors.hpp"
#include "planner/core/HeuristicEstimator.hpp"
#include "planner/core/IdGenerator.hpp"
#include "planner/core/Logging.hpp"
#include "planner/core/ReminderPolicy.hpp"
#include "planner/data/TaskJson.hpp"
#include "planner/data/TaskStore.hpp"

namespace planner {
namespace core {

namespace {
constexpr double OverdueUrgencyHours = -1000.0;
constexpr double HoursPerScoreUnit = 24.0;

QStringList uniqueInOrder(const QStringList &values)
{
    QStringList result;
    for (const QString &value : values) {
        if (!result.contains(value)) {
            result << value;
        }
    }
    return result;
}

int toInt(const QString &key, const QVariant &value)
{
    bool ok = false;
    const qlonglong result = value.toLongLong(&ok);
    if (!ok) {
        throw FormatError(QStringLiteral("Field '%1' must be an integer").arg(key));
    }
    if (result < std::numeric_limits<int>::min() || result > std::numeric_limits<int>::max()) {
        throw FormatError(QStringLiteral("Field '%1' is out of range: %2").arg(key).arg(result));
    }
    return static_cast<int>(result);
}

bool isBlank(const QVariant &value)
{
    return value.isNull() || (value.userType() == QMetaType::QString && value.toString().trimmed().isEmpty());
}

// The command line hands lists over as comma separated text.
QStringList toStringList(const QVariant &value)
{
    if (value.isNull()) {
        return {};
    }
    if (value.userType() == QMetaType::QString) {
        QStringList parts;
        for (const QString &part : value.toString().split(QLatin1Char(','), Qt::SkipEmptyParts)) {
            parts << part.trimmed();
        }
        return parts;
    }
    return value.toStringList();
}
} // namespace

SchedulingEngine::SchedulingEngine(data::TaskStore &store, const Clock &clock, const DateParser &dateParser,
                                   IdGenerator &idGenerator)
    : m_store(store)
    , m_clock(clock)
    , m_dateParser(dateParser)
    , m_idGenerator(idGenerator)
{
}

data::Task SchedulingEngine::createTask(TaskDraft draft)
{
    QString title = draft.title.trimmed();
    QString description = draft.description.trimmed();
    if (title.isEmpty()) {
        qCWarning(lcPlannerEngine) << "rejected task without title";
        throw FormatError(QStringLiteral("Task title is required"));
    }

    const QDateTime now = m_clock.now();
    QDateTime deadline;
    std::optional<int> priority = draft.priority;

    if (draft.useNaturalLanguageAssist) {
        const QString text = description.isEmpty() ? title : QStringLiteral("%1 %2").arg(title, description);
        const NaturalTextHints hints = HeuristicEstimator::parseNaturalText(text, now);
        title = hints.title;
        description = hints.description;
        if (draft.deadlineText.trimmed().isEmpty() && hints.deadline.isValid()) {
            deadline = hints.deadline;
        }
        if (hints.urgent && !priority) {
            priority = 1;
        }
    }

    if (!draft.deadlineText.trimmed().isEmpty()) {
        try {
            deadline = m_dateParser.parse(draft.deadlineText);
        } catch (const ParseError &) {
            qCWarning(lcPlannerEngine) << "rejected unparseable deadline" << draft.deadlineText;
            throw;
        }
    }

    data::Task task;
    task.id = m_idGenerator.newId();
    task.title = title;
    task.description = description;
    task.createdAt = now;
    task.dependencies = uniqueInOrder(draft.dependencies);

    if (!priority) {
        const Estimate estimate = HeuristicEstimator::estimate(title, description, deadline, now);
        task.priority = estimate.priority;
        task.deadline = deadline.isValid() ? deadline : estimate.deadline;
        task.tags = estimate.tags;
        task.estimatedEffortMinutes = estimate.estimatedEffortMinutes;
        task.autoAssigned = true;
    } else {
        task.priority = *priority;
        task.deadline = deadline;
        task.tags = draft.tags;
        task.estimatedEffortMinutes = draft.estimatedEffortMinutes;
        task.autoAssigned = false;
    }
    if (task.deadline.isValid()) {
        task.deadline = task.deadline.toUTC();
    }

    const data::Task created = m_store.create(std::move(task));
    qCDebug(lcPlannerEngine) << "created task" << created.id << "priority" << created.priority
                             << (created.autoAssigned ? "(auto)" : "(manual)");
    return created;
}

data::TaskPatch SchedulingEngine::patchFromFields(const QVariantMap &fields) const
{
    data::TaskPatch patch;
    for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
        const QString &key = it.key();
        const QVariant &value = it.value();
        if (key == QLatin1String(data::fields::Title)) {
            patch.title = value.toString();
        } else if (key == QLatin1String(data::fields::Description)) {
            patch.description = value.toString();
        } else if (key == QLatin1String(data::fields::Priority)) {
            patch.priority = toInt(key, value);
        } else if (key == QLatin1String(data::fields::Deadline)) {
            if (isBlank(value)) {
                patch.deadline = QDateTime();
            } else if (value.userType() == QMetaType::QDateTime) {
                patch.deadline = value.toDateTime();
            } else {
                patch.deadline = m_dateParser.parse(value.toString());
            }
        } else if (key == QLatin1String(data::fields::Progress)) {
            patch.progress = data::clampProgress(toInt(key, value));
        } else if (key == QLatin1String(data::fields::Completed)) {
            patch.completed = value.toBool();
        } else if (key == QLatin1String(data::fields::Dependencies)) {
            patch.dependencies = uniqueInOrder(toStringList(value));
        } else if (key == QLatin1String(data::fields::Tags)) {
            patch.tags = toStringList(value);
        } else if (key == QLatin1String(data::fields::EstimatedMinutes)) {
            patch.estimatedEffortMinutes = isBlank(value) ? std::optional<int>() : std::optional<int>(toInt(key, value));
        } else {
            qCDebug(lcPlannerEngine) << "ignoring unknown update field" << key;
        }
    }
    return patch;
}

data::Task SchedulingEngine::updateTask(const QString &id, const QVariantMap &fields)
{
    data::Task current = getTask(id);

    data::TaskPatch patch;
    try {
        patch = patchFromFields(fields);
    } catch (const PlannerError &error) {
        qCWarning(lcPlannerEngine) << "rejected update of" << id << ":" << error.what();
        throw;
    }

    if (patch.completed && !*patch.completed) {
        // Completion is one-way.
        patch.completed.reset();
    }
    const bool completes = (patch.completed && *patch.completed) || (patch.progress && *patch.progress == 100);
    if (completes && !current.completed) {
        if (patch.dependencies) {
            current.dependencies = *patch.dependencies;
        }
        requireDependenciesMet(current);
    }

    return m_store.update(id, patch);
}

void SchedulingEngine::deleteTask(const QString &id)
{
    if (!m_store.remove(id)) {
        qCDebug(lcPlannerEngine) << "delete of unknown task" << id << "ignored";
    }
}

data::Task SchedulingEngine::setProgress(const QString &id, int value)
{
    const data::Task current = getTask(id);
    data::TaskPatch patch;
    patch.progress = data::clampProgress(value);
    if (*patch.progress == 100 && !current.completed) {
        requireDependenciesMet(current);
    }
    return m_store.update(id, patch);
}

data::Task SchedulingEngine::completeTask(const QString &id)
{
    const data::Task current = getTask(id);
    requireDependenciesMet(current);
    data::TaskPatch patch;
    patch.completed = true;
    patch.progress = 100;
    const data::Task completed = m_store.update(id, patch);
    qCDebug(lcPlannerEngine) << "completed task" << id;
    return completed;
}

QStringList SchedulingEngine::unmetDependencies(const QString &id) const
{
    return unmetDependenciesOf(getTask(id));
}

QStringList SchedulingEngine::unmetDependenciesOf(const data::Task &task) const
{
    QStringList unmet;
    for (const QString &dependencyId : task.dependencies) {
        const auto dependency = m_store.findById(dependencyId);
        if (!dependency || !dependency->completed) {
            unmet << dependencyId;
        }
    }
    return unmet;
}

void SchedulingEngine::requireDependenciesMet(const data::Task &task) const
{
    const QStringList unmet = unmetDependenciesOf(task);
    if (!unmet.isEmpty()) {
        qCWarning(lcPlannerEngine) << "completion of" << task.id << "blocked by" << unmet;
        throw DependencyError(task.id, unmet);
    }
}

std::optional<data::Task> SchedulingEngine::peekNext()
{
    return m_store.peekNext();
}

std::optional<data::Task> SchedulingEngine::popNext()
{
    return m_store.popNext();
}

double SchedulingEngine::scheduleScore(const data::Task &task, const QDateTime &now)
{
    double urgencyHours = 0.0;
    if (task.hasDeadline()) {
        const qint64 remainingMsecs = now.msecsTo(task.deadline);
        urgencyHours = remainingMsecs <= 0 ? OverdueUrgencyHours : static_cast<double>(remainingMsecs) / 3600000.0;
    }
    return task.priority + urgencyHours / HoursPerScoreUnit;
}

QStringList SchedulingEngine::globalSchedule() const
{
    const QDateTime now = m_clock.now();
    std::vector<std::pair<double, QString>> scored;
    for (const data::Task &task : m_store.listActive()) {
        scored.emplace_back(scheduleScore(task, now), task.id);
    }
    std::stable_sort(scored.begin(), scored.end(), [](const auto &lhs, const auto &rhs) {
        return lhs.first < rhs.first;
    });

    QStringList order;
    order.reserve(static_cast<int>(scored.size()));
    for (const auto &entry : scored) {
        order << entry.second;
    }
    return order;
}

void SchedulingEngine::markReminded(const QString &id)
{
    data::TaskPatch patch;
    patch.notified = true;
    m_store.update(id, patch);
}

std::vector<data::Task> SchedulingEngine::pendingReminders(const ReminderPolicy &policy) const
{
    return policy.dueReminders(m_store.listActive(), m_clock.now());
}

data::Task SchedulingEngine::getTask(const QString &id) const
{
    try {
        return m_store.get(id);
    } catch (const NotFoundError &) {
        qCDebug(lcPlannerEngine) << "unknown task" << id;
        throw;
    }
}

std::vector<data::Task> SchedulingEngine::listTasks(bool includeCompleted) const
{
    return includeCompleted ? m_store.listAll() : m_store.listActive();
}

QByteArray SchedulingEngine::exportSnapshot() const
{
    return data::encodeSnapshot(m_store.listAll());
}

void SchedulingEngine::importSnapshot(const QByteArray &payload)
{
    std::vector<data::Task> tasks;
    try {
        tasks = data::decodeSnapshot(payload, m_clock.now(), [this]() { return m_idGenerator.newId(); });
    } catch (const FormatError &error) {
        qCWarning(lcPlannerEngine) << "rejected snapshot:" << error.what();
        throw;
    }
    m_store.bulkReplace(std::move(tasks));
    qCDebug(lcPlannerEngine) << "imported" << m_store.size() << "tasks";
}

} // namespace core
} // namespace planner
