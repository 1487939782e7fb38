#pragma once

#include <QString>
#include <QStringList>
#include <optional>

class QSettings;
class QTextStream;

namespace cadence {
namespace app {

struct ScheduleOptions
{
    QString schedule;
    QString start; // empty means today
    QString end;
    bool showNext = false;
    bool listOccurrences = false;
    bool json = false;
    bool verbose = false;
    bool helpRequested = false;
    bool versionRequested = false;
    int occurrenceLimit = 24;
};

class ScheduleCommand
{
public:
    explicit ScheduleCommand(ScheduleOptions options);

    // Reads the persisted defaults; missing keys keep the built-in values.
    static ScheduleOptions defaultsFromSettings(const QSettings &settings);
    static std::optional<ScheduleOptions> parseArguments(const QStringList &arguments,
                                                         const ScheduleOptions &defaults,
                                                         QString *errorMessage);
    static QString helpText();

    int run(QTextStream &out, QTextStream &err) const;
    const ScheduleOptions &options() const;

private:
    ScheduleOptions m_options;
};

} // namespace app
} // namespace cadence
