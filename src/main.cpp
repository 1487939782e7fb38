#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <cstdio>

#include "version.h"

#include "cadence/app/ScheduleCommand.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Cadence"));
    QCoreApplication::setApplicationName(QStringLiteral("cadence"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kCadenceVersion));

    QCoreApplication app(argc, argv);
    QTextStream out(stdout);
    QTextStream err(stderr);

    QSettings settings;
    const auto defaults = cadence::app::ScheduleCommand::defaultsFromSettings(settings);

    QString errorMessage;
    const auto options = cadence::app::ScheduleCommand::parseArguments(app.arguments(), defaults, &errorMessage);
    if (!options) {
        err << "error: " << errorMessage << '\n';
        return 1;
    }
    if (options->helpRequested) {
        out << cadence::app::ScheduleCommand::helpText();
        return 0;
    }
    if (options->versionRequested) {
        out << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << '\n';
        return 0;
    }
    if (options->verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("cadence.*.debug=true"));
    }

    const cadence::app::ScheduleCommand command(*options);
    return command.run(out, err);
}
