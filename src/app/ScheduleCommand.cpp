#include "cadence/app/ScheduleCommand.hpp"

#include "cadence/core/Calendar.hpp"
#include "cadence/core/Repetition.hpp"
#include "cadence/data/RepetitionJson.hpp"
#include "cadence/text/Display.hpp"
#include "cadence/text/ScheduleParser.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>

Q_LOGGING_CATEGORY(lcCadenceApp, "cadence.app")

namespace cadence {
namespace app {

namespace {
const QString DefaultEndKey = QStringLiteral("schedule/defaultEnd");
const QString OutputFormatKey = QStringLiteral("output/format");
const QString OccurrenceLimitKey = QStringLiteral("output/occurrenceLimit");

struct CommandLine
{
    QCommandLineParser parser;
    QCommandLineOption scheduleOption{{QStringLiteral("s"), QStringLiteral("schedule")},
                                      QStringLiteral("Repetition schedule, e.g. \"every 2 weeks on mon\"."),
                                      QStringLiteral("text")};
    QCommandLineOption startOption{{QStringLiteral("d"), QStringLiteral("start")},
                                   QStringLiteral("First occurrence (yyyy-mm-dd), defaults to today."),
                                   QStringLiteral("date")};
    QCommandLineOption endOption{{QStringLiteral("e"), QStringLiteral("end")},
                                 QStringLiteral("When the schedule stops: never, a date or \"after N times\"."),
                                 QStringLiteral("text")};
    QCommandLineOption nextOption{{QStringLiteral("n"), QStringLiteral("next")},
                                  QStringLiteral("Print the occurrence following the start date.")};
    QCommandLineOption listOption{{QStringLiteral("l"), QStringLiteral("list")},
                                  QStringLiteral("List the occurrences after the start date.")};
    QCommandLineOption limitOption{QStringLiteral("limit"),
                                   QStringLiteral("Maximum number of listed occurrences."),
                                   QStringLiteral("count")};
    QCommandLineOption jsonOption{QStringLiteral("json"), QStringLiteral("Print the schedule as JSON.")};
    QCommandLineOption verboseOption{QStringLiteral("verbose"), QStringLiteral("Enable debug logging.")};
    QCommandLineOption helpOption;
    QCommandLineOption versionOption;

    CommandLine()
        : helpOption(parser.addHelpOption())
        , versionOption(parser.addVersionOption())
    {
        parser.setApplicationDescription(QStringLiteral("Resolves recurring calendar schedules."));
        parser.addOption(scheduleOption);
        parser.addOption(startOption);
        parser.addOption(endOption);
        parser.addOption(nextOption);
        parser.addOption(listOption);
        parser.addOption(limitOption);
        parser.addOption(jsonOption);
        parser.addOption(verboseOption);
    }
};

void printError(QTextStream &err, const QString &message)
{
    err << "error: " << message << '\n';
    err.flush();
}
} // namespace

ScheduleCommand::ScheduleCommand(ScheduleOptions options)
    : m_options(std::move(options))
{
}

ScheduleOptions ScheduleCommand::defaultsFromSettings(const QSettings &settings)
{
    ScheduleOptions options;
    options.end = settings.value(DefaultEndKey, options.end).toString();
    options.json = settings.value(OutputFormatKey, QStringLiteral("text")).toString().compare(
                       QLatin1String("json"), Qt::CaseInsensitive)
        == 0;
    const int limit = settings.value(OccurrenceLimitKey, options.occurrenceLimit).toInt();
    options.occurrenceLimit = qBound(1, limit, 1000);
    return options;
}

std::optional<ScheduleOptions> ScheduleCommand::parseArguments(const QStringList &arguments,
                                                               const ScheduleOptions &defaults,
                                                               QString *errorMessage)
{
    CommandLine commandLine;
    if (!commandLine.parser.parse(arguments)) {
        if (errorMessage) {
            *errorMessage = commandLine.parser.errorText();
        }
        return std::nullopt;
    }

    ScheduleOptions options = defaults;
    options.helpRequested = commandLine.parser.isSet(commandLine.helpOption);
    options.versionRequested = commandLine.parser.isSet(commandLine.versionOption);
    if (commandLine.parser.isSet(commandLine.scheduleOption)) {
        options.schedule = commandLine.parser.value(commandLine.scheduleOption);
    } else if (!commandLine.parser.positionalArguments().isEmpty()) {
        options.schedule = commandLine.parser.positionalArguments().join(QLatin1Char(' '));
    }
    if (commandLine.parser.isSet(commandLine.startOption)) {
        options.start = commandLine.parser.value(commandLine.startOption);
    }
    if (commandLine.parser.isSet(commandLine.endOption)) {
        options.end = commandLine.parser.value(commandLine.endOption);
    }
    if (commandLine.parser.isSet(commandLine.limitOption)) {
        bool ok = false;
        const int limit = commandLine.parser.value(commandLine.limitOption).toInt(&ok);
        if (!ok || limit <= 0) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("invalid occurrence limit");
            }
            return std::nullopt;
        }
        options.occurrenceLimit = limit;
    }
    options.showNext = options.showNext || commandLine.parser.isSet(commandLine.nextOption);
    options.listOccurrences = options.listOccurrences || commandLine.parser.isSet(commandLine.listOption);
    options.json = options.json || commandLine.parser.isSet(commandLine.jsonOption);
    options.verbose = options.verbose || commandLine.parser.isSet(commandLine.verboseOption);
    return options;
}

QString ScheduleCommand::helpText()
{
    CommandLine commandLine;
    return commandLine.parser.helpText();
}

const ScheduleOptions &ScheduleCommand::options() const
{
    return m_options;
}

int ScheduleCommand::run(QTextStream &out, QTextStream &err) const
{
    if (m_options.schedule.trimmed().isEmpty()) {
        printError(err, QStringLiteral("missing schedule"));
        return 1;
    }

    core::DateError error;
    core::SimpleDate start = core::SimpleDate::today();
    if (!m_options.start.trimmed().isEmpty()) {
        const auto parsed = core::SimpleDate::fromString(m_options.start, &error);
        if (!parsed) {
            printError(err, error.message);
            return 1;
        }
        start = *parsed;
    }
    if (start < core::firstWeekdayDate()) {
        printError(err,
                   QStringLiteral("start date before %1 is not supported").arg(core::firstWeekdayDate().toString()));
        return 1;
    }

    const auto repetition = text::parseRepetition(m_options.schedule, m_options.end, start, &error);
    if (!repetition) {
        printError(err, error.message);
        return 1;
    }
    qCDebug(lcCadenceApp) << "resolved" << text::toString(*repetition) << "from" << start.toString();

    const core::SimpleDate last = start + *repetition;

    if (m_options.json) {
        QJsonObject document;
        document.insert(QStringLiteral("start"), data::toJson(start));
        document.insert(QStringLiteral("repetition"), data::toJson(*repetition));
        document.insert(QStringLiteral("last"), data::toJson(last));
        out << QJsonDocument(document).toJson(QJsonDocument::Indented);
        out.flush();
        return 0;
    }

    out << "every " << text::toString(*repetition) << '\n';
    out << "start: " << start.toString() << '\n';
    if (m_options.showNext) {
        out << "next: " << (start + repetition->delta).toString() << '\n';
    }
    if (m_options.listOccurrences) {
        for (const auto &date : core::occurrences(start, *repetition, m_options.occurrenceLimit)) {
            out << "  " << date.toString() << '\n';
        }
    }
    if (repetition->end.isNever()) {
        out << "last: never\n";
    } else {
        out << "last: " << last.toString() << '\n';
    }
    out.flush();
    return 0;
}

} // namespace app
} // namespace cadence
