#include "planner/cli/CommandRunner.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QJsonDocument>
#include <QTextStream>
#include <QVariantMap>
#include <optional>
#include <utility>

#include "planner/core/AppContext.hpp"
#include "planner/core/Errors.hpp"
#include "planner/core/Logging.hpp"
#include "planner/core/SchedulingEngine.hpp"
#include "planner/data/FileSnapshotStorage.hpp"
#include "planner/data/TaskJson.hpp"

namespace planner {
namespace cli {

namespace {
const QCommandLineOption StoreOption(QStringLiteral("store"), QStringLiteral("Snapshot file to use."),
                                     QStringLiteral("path"));
const QCommandLineOption NoSeedOption(QStringLiteral("no-seed"),
                                      QStringLiteral("Do not create demo tasks for a new store."));
const QCommandLineOption DescriptionOption(QStringLiteral("description"), QStringLiteral("Task description."),
                                           QStringLiteral("text"));
const QCommandLineOption DeadlineOption(QStringLiteral("deadline"), QStringLiteral("Deadline expression."),
                                        QStringLiteral("when"));
const QCommandLineOption PriorityOption(QStringLiteral("priority"),
                                        QStringLiteral("Explicit priority, lower is more urgent."),
                                        QStringLiteral("n"));
const QCommandLineOption DependsOption(QStringLiteral("depends"), QStringLiteral("Comma separated task ids."),
                                       QStringLiteral("ids"));
const QCommandLineOption TagsOption(QStringLiteral("tags"), QStringLiteral("Comma separated tags."),
                                    QStringLiteral("tags"));
const QCommandLineOption MinutesOption(QStringLiteral("minutes"), QStringLiteral("Estimated effort in minutes."),
                                       QStringLiteral("n"));
const QCommandLineOption AssistOption(QStringLiteral("assist"),
                                      QStringLiteral("Derive title and deadline from natural text."));
const QCommandLineOption AllOption(QStringLiteral("all"), QStringLiteral("Include completed tasks."));
const QCommandLineOption MarkOption(QStringLiteral("mark"), QStringLiteral("Mark listed reminders as delivered."));

QStringList splitCsv(const QString &value)
{
    QStringList parts;
    for (const QString &part : value.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty()) {
            parts << trimmed;
        }
    }
    return parts;
}

std::optional<int> parseOptionalInt(const QString &text, const QString &name)
{
    if (text.isEmpty()) {
        return std::nullopt;
    }
    bool ok = false;
    const int value = text.toInt(&ok);
    if (!ok) {
        throw core::FormatError(QStringLiteral("%1 must be an integer: %2").arg(name, text));
    }
    return value;
}

bool hasArgs(const QStringList &args, int count)
{
    return args.size() >= count;
}
} // namespace

CommandRunner::CommandRunner(core::AppContext &context, core::Settings settings, QTextStream &out,
                             QTextStream &err)
    : m_context(context)
    , m_settings(std::move(settings))
    , m_out(out)
    , m_err(err)
{
}

int CommandRunner::run(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Priority Planner - what should be worked on next?"));
    parser.addOptions({ StoreOption, NoSeedOption, DescriptionOption, DeadlineOption, PriorityOption, DependsOption,
                        TagsOption, MinutesOption, AssistOption, AllOption, MarkOption });
    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("add, list, show, next, pop, update, progress, complete, delete, schedule, reminders, "
                       "export, import"));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."), QStringLiteral("[args...]"));

    if (!parser.parse(arguments)) {
        return usage(parser.errorText());
    }
    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usage(QStringLiteral("No command given"));
    }
    const QString command = positional.takeFirst();

    const QString path = parser.isSet(StoreOption) ? parser.value(StoreOption) : m_settings.snapshotPath;
    data::FileSnapshotStorage storage(path);
    m_storeChanged = false;

    try {
        const auto payload = storage.load();
        if (payload) {
            m_context.engine().importSnapshot(*payload);
        } else if (!parser.isSet(NoSeedOption)) {
            seedDemoTasks();
        }

        const int status = execute(command, positional, parser);
        if (m_storeChanged) {
            storage.save(m_context.engine().exportSnapshot());
        }
        return status;
    } catch (const core::PlannerError &error) {
        m_err << "error: " << error.what() << '\n';
    }
    m_err.flush();
    return 1;
}

void CommandRunner::seedDemoTasks()
{
    auto &engine = m_context.engine();

    core::TaskDraft welcome;
    welcome.title = QStringLiteral("Welcome: Your Priority Planner is ready");
    welcome.description = QStringLiteral("This is a demo task (auto-generated)");
    welcome.priority = 5;
    engine.createTask(welcome);

    core::TaskDraft report;
    report.title = QStringLiteral("Finish report by tomorrow");
    report.description = QStringLiteral("Q3 summary");
    report.priority = 2;
    report.deadlineText = QStringLiteral("tomorrow");
    engine.createTask(report);

    core::TaskDraft call;
    call.title = QStringLiteral("Quick call with team");
    call.description = QStringLiteral("Discuss milestones");
    call.priority = 3;
    call.deadlineText = QStringLiteral("in 8 hours");
    engine.createTask(call);

    qCInfo(lcPlannerApp) << "seeded demo tasks";
    m_storeChanged = true;
}

int CommandRunner::execute(const QString &command, const QStringList &args, const QCommandLineParser &parser)
{
    auto &engine = m_context.engine();

    if (command == QLatin1String("add")) {
        return addTask(args, parser);
    }
    if (command == QLatin1String("list")) {
        return listTasks(parser);
    }
    if (command == QLatin1String("show")) {
        return showTask(args);
    }
    if (command == QLatin1String("next") || command == QLatin1String("pop")) {
        const auto task = command == QLatin1String("next") ? engine.peekNext() : engine.popNext();
        if (!task) {
            m_out << "No open tasks\n";
        } else {
            printTask(*task);
        }
        m_out.flush();
        return 0;
    }
    if (command == QLatin1String("update")) {
        return updateTask(args);
    }
    if (command == QLatin1String("progress")) {
        return setProgress(args);
    }
    if (command == QLatin1String("complete") || command == QLatin1String("delete")) {
        if (!hasArgs(args, 1)) {
            return usage(QStringLiteral("%1 needs a task id").arg(command));
        }
        if (command == QLatin1String("complete")) {
            engine.completeTask(args.at(0));
        } else {
            engine.deleteTask(args.at(0));
        }
        m_storeChanged = true;
        return 0;
    }
    if (command == QLatin1String("schedule")) {
        return printSchedule();
    }
    if (command == QLatin1String("reminders")) {
        return reminders(parser);
    }
    if (command == QLatin1String("export")) {
        return exportTo(args);
    }
    if (command == QLatin1String("import")) {
        return importFrom(args);
    }
    return usage(QStringLiteral("Unknown command: %1").arg(command));
}

int CommandRunner::usage(const QString &message)
{
    m_err << "error: " << message << '\n'
          << "usage: planner [--store path] <command> [args...]\n";
    m_err.flush();
    return 1;
}

void CommandRunner::printTask(const data::Task &task)
{
    m_out << task.id << "  [P" << task.priority << "] " << task.title;
    if (task.hasDeadline()) {
        m_out << "  due " << data::formatTimestamp(task.deadline);
    }
    m_out << "  " << task.progress << '%';
    if (task.completed) {
        m_out << "  done";
    }
    if (!task.tags.isEmpty()) {
        m_out << "  #" << task.tags.join(QStringLiteral(" #"));
    }
    m_out << '\n';
}

int CommandRunner::addTask(const QStringList &args, const QCommandLineParser &parser)
{
    if (!hasArgs(args, 1)) {
        return usage(QStringLiteral("add needs a title"));
    }
    core::TaskDraft draft;
    draft.title = args.join(QLatin1Char(' '));
    draft.description = parser.value(DescriptionOption);
    draft.deadlineText = parser.value(DeadlineOption);
    draft.priority = parseOptionalInt(parser.value(PriorityOption), QStringLiteral("priority"));
    draft.dependencies = splitCsv(parser.value(DependsOption));
    draft.tags = splitCsv(parser.value(TagsOption));
    draft.estimatedEffortMinutes = parseOptionalInt(parser.value(MinutesOption), QStringLiteral("minutes"));
    draft.useNaturalLanguageAssist = parser.isSet(AssistOption);

    const data::Task task = m_context.engine().createTask(draft);
    m_storeChanged = true;
    printTask(task);
    m_out.flush();
    return 0;
}

int CommandRunner::listTasks(const QCommandLineParser &parser)
{
    for (const auto &task : m_context.engine().listTasks(parser.isSet(AllOption))) {
        printTask(task);
    }
    m_out.flush();
    return 0;
}

int CommandRunner::showTask(const QStringList &args)
{
    if (!hasArgs(args, 1)) {
        return usage(QStringLiteral("show needs a task id"));
    }
    const data::Task task = m_context.engine().getTask(args.at(0));
    m_out << QJsonDocument(data::taskToJson(task)).toJson(QJsonDocument::Indented);
    m_out.flush();
    return 0;
}

int CommandRunner::updateTask(const QStringList &args)
{
    if (!hasArgs(args, 2)) {
        return usage(QStringLiteral("update needs a task id and key=value pairs"));
    }
    QVariantMap fields;
    for (int i = 1; i < args.size(); ++i) {
        const int separator = args.at(i).indexOf(QLatin1Char('='));
        if (separator <= 0) {
            return usage(QStringLiteral("Expected key=value, got %1").arg(args.at(i)));
        }
        fields.insert(args.at(i).left(separator), args.at(i).mid(separator + 1));
    }
    const data::Task task = m_context.engine().updateTask(args.at(0), fields);
    m_storeChanged = true;
    printTask(task);
    m_out.flush();
    return 0;
}

int CommandRunner::setProgress(const QStringList &args)
{
    if (!hasArgs(args, 2)) {
        return usage(QStringLiteral("progress needs a task id and a value"));
    }
    const auto value = parseOptionalInt(args.at(1), QStringLiteral("progress"));
    if (!value) {
        return usage(QStringLiteral("progress needs a value"));
    }
    const data::Task task = m_context.engine().setProgress(args.at(0), *value);
    m_storeChanged = true;
    printTask(task);
    m_out.flush();
    return 0;
}

int CommandRunner::printSchedule()
{
    auto &engine = m_context.engine();
    int position = 1;
    for (const QString &id : engine.globalSchedule()) {
        m_out << position++ << ". " << id << "  " << engine.getTask(id).title << '\n';
    }
    m_out.flush();
    return 0;
}

int CommandRunner::reminders(const QCommandLineParser &parser)
{
    auto &engine = m_context.engine();
    const auto due = engine.pendingReminders(m_settings.reminderPolicy());
    for (const auto &task : due) {
        m_out << "Reminder: " << task.title << "  due " << data::formatTimestamp(task.deadline) << '\n';
        if (parser.isSet(MarkOption)) {
            engine.markReminded(task.id);
            m_storeChanged = true;
        }
    }
    m_out.flush();
    return 0;
}

int CommandRunner::exportTo(const QStringList &args)
{
    if (!hasArgs(args, 1)) {
        return usage(QStringLiteral("export needs a file name"));
    }
    data::FileSnapshotStorage(args.at(0)).save(m_context.engine().exportSnapshot());
    return 0;
}

int CommandRunner::importFrom(const QStringList &args)
{
    if (!hasArgs(args, 1)) {
        return usage(QStringLiteral("import needs a file name"));
    }
    const auto payload = data::FileSnapshotStorage(args.at(0)).load();
    if (!payload) {
        throw core::PlannerError(QStringLiteral("No such file: %1").arg(args.at(0)));
    }
    m_context.engine().importSnapshot(*payload);
    m_storeChanged = true;
    return 0;
}

} // namespace cli
} // namespace planner
