#pragma once

#include <QString>

namespace cadence {
namespace core {

struct DateError
{
    QString message;
};

// Fills *error when the caller asked for it.
inline void setDateError(DateError *error, const QString &message)
{
    if (error) {
        error->message = message;
    }
}

} // namespace core
} // namespace cadence
