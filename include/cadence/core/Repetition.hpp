#pragma once

#include <QtGlobal>
#include <vector>

#include "cadence/core/RepDelta.hpp"
#include "cadence/core/SimpleDate.hpp"

namespace cadence {
namespace core {

// Stopping condition of a recurring schedule.
class RepEnd
{
public:
    enum class Kind
    {
        Never,
        Date,
        Count,
    };

    RepEnd() = default;

    static RepEnd never();
    static RepEnd until(const SimpleDate &date);
    static RepEnd afterCount(quint64 count);

    Kind kind() const;
    bool isNever() const;
    SimpleDate date() const;
    quint64 count() const;

    bool operator==(const RepEnd &other) const;
    bool operator!=(const RepEnd &other) const;

private:
    Kind m_kind = Kind::Never;
    SimpleDate m_date;
    quint64 m_count = 0;
};

struct Repetition
{
    RepDelta delta;
    RepEnd end;
};

// Returned for schedules that never end.
SimpleDate maxDate();

// Last occurrence of the schedule that starts at `start`.
SimpleDate lastOccurrence(const SimpleDate &start, const Repetition &repetition);
SimpleDate operator+(const SimpleDate &start, const Repetition &repetition);

// Successive step results after `start`, at most `limit` entries.
std::vector<SimpleDate> occurrences(const SimpleDate &start, const Repetition &repetition, int limit);

} // namespace core
} // namespace cadence
