#include "cadence/core/Repetition.hpp"

#include "cadence/core/Logging.hpp"

namespace cadence {
namespace core {

RepEnd RepEnd::never()
{
    return RepEnd();
}

RepEnd RepEnd::until(const SimpleDate &date)
{
    RepEnd end;
    end.m_kind = Kind::Date;
    end.m_date = date;
    return end;
}

RepEnd RepEnd::afterCount(quint64 count)
{
    RepEnd end;
    end.m_kind = Kind::Count;
    end.m_count = count;
    return end;
}

RepEnd::Kind RepEnd::kind() const
{
    return m_kind;
}

bool RepEnd::isNever() const
{
    return m_kind == Kind::Never;
}

SimpleDate RepEnd::date() const
{
    return m_date;
}

quint64 RepEnd::count() const
{
    return m_count;
}

bool RepEnd::operator==(const RepEnd &other) const
{
    if (m_kind != other.m_kind) {
        return false;
    }
    switch (m_kind) {
    case Kind::Date:
        return m_date == other.m_date;
    case Kind::Count:
        return m_count == other.m_count;
    case Kind::Never:
    default:
        return true;
    }
}

bool RepEnd::operator!=(const RepEnd &other) const
{
    return !(*this == other);
}

SimpleDate maxDate()
{
    return SimpleDate::fromYmd(9999, 12, 31);
}

SimpleDate lastOccurrence(const SimpleDate &start, const Repetition &repetition)
{
    SimpleDate end = start;

    switch (repetition.end.kind()) {
    case RepEnd::Kind::Never:
        return maxDate();
    case RepEnd::Kind::Count:
        for (quint64 i = 0; i < repetition.end.count(); ++i) {
            end = end + repetition.delta;
        }
        return end;
    case RepEnd::Kind::Date: {
        const SimpleDate limit = repetition.end.date();
        while (end < limit) {
            const SimpleDate next = end + repetition.delta;
            if (next > limit) {
                return end;
            }
            if (next <= end) {
                qCWarning(lcCadenceCore) << "recurrence step did not advance past" << end.toString();
                return end;
            }
            end = next;
        }
        return end;
    }
    }
    return end;
}

SimpleDate operator+(const SimpleDate &start, const Repetition &repetition)
{
    return lastOccurrence(start, repetition);
}

std::vector<SimpleDate> occurrences(const SimpleDate &start, const Repetition &repetition, int limit)
{
    std::vector<SimpleDate> result;
    if (limit <= 0) {
        return result;
    }
    result.reserve(static_cast<std::size_t>(limit));

    SimpleDate current = start;
    while (result.size() < static_cast<std::size_t>(limit)) {
        if (repetition.end.kind() == RepEnd::Kind::Count && result.size() >= repetition.end.count()) {
            break;
        }
        const SimpleDate next = current + repetition.delta;
        if (repetition.end.kind() == RepEnd::Kind::Date) {
            if (current >= repetition.end.date() || next > repetition.end.date()) {
                break;
            }
        }
        if (next <= current) {
            qCWarning(lcCadenceCore) << "recurrence step did not advance past" << current.toString();
            break;
        }
        result.push_back(next);
        current = next;
    }
    return result;
}

} // namespace core
} // namespace cadence
