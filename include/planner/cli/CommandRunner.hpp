#pragma once

#include <QString>
#include <QStringList>

#include "planner/core/Settings.hpp"

class QCommandLineParser;
class QTextStream;

namespace planner {
namespace data {
struct Task;
}

namespace core {
class AppContext;
}

namespace cli {

class CommandRunner
{
public:
    CommandRunner(core::AppContext &context, core::Settings settings, QTextStream &out, QTextStream &err);

    // arguments[0] is the program name, as in QCoreApplication::arguments().
    int run(const QStringList &arguments);

private:
    void seedDemoTasks();
    int execute(const QString &command, const QStringList &args, const QCommandLineParser &parser);
    int usage(const QString &message);
    void printTask(const data::Task &task);

    int addTask(const QStringList &args, const QCommandLineParser &parser);
    int listTasks(const QCommandLineParser &parser);
    int showTask(const QStringList &args);
    int updateTask(const QStringList &args);
    int setProgress(const QStringList &args);
    int printSchedule();
    int reminders(const QCommandLineParser &parser);
    int exportTo(const QStringList &args);
    int importFrom(const QStringList &args);

    core::AppContext &m_context;
    core::Settings m_settings;
    QTextStream &m_out;
    QTextStream &m_err;
    bool m_storeChanged = false;
};

} // namespace cli
} // namespace planner
