#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <cstdio>

#include "version.h"

#include "planner/cli/CommandRunner.hpp"
#include "planner/core/AppContext.hpp"
#include "planner/core/Settings.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Priority Planner"));
    QCoreApplication::setApplicationName(QStringLiteral("planner"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kPlannerVersion));

    QCoreApplication app(argc, argv);

    QSettings settings;
    const auto config = planner::core::Settings::load(settings);
    if (!config.loggingRules.isEmpty()) {
        QLoggingCategory::setFilterRules(config.loggingRules);
    }

    QTextStream out(stdout);
    QTextStream err(stderr);

    planner::core::AppContext context;
    planner::cli::CommandRunner runner(context, config, out, err);
    return runner.run(QCoreApplication::arguments());
}
