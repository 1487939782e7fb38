#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <optional>

#include "cadence/core/DateError.hpp"
#include "cadence/core/RepDelta.hpp"
#include "cadence/core/Repetition.hpp"
#include "cadence/core/SimpleDate.hpp"
#include "cadence/core/Weekday.hpp"

namespace cadence {
namespace data {

// Externally tagged JSON form shared with other tools reading the same
// records, e.g. {"Month":{"OnWeek":{"nth":1,"weekid":2,"day":"Friday"}}}.
QJsonObject toJson(const core::SimpleDate &date);
QJsonValue toJson(core::Weekday weekday);
QJsonObject toJson(const core::RepDelta &delta);
QJsonValue toJson(const core::RepEnd &end);
QJsonObject toJson(const core::Repetition &repetition);

std::optional<core::SimpleDate> simpleDateFromJson(const QJsonValue &value, core::DateError *error = nullptr);
std::optional<core::Weekday> weekdayFromJson(const QJsonValue &value, core::DateError *error = nullptr);
std::optional<core::RepDelta> repDeltaFromJson(const QJsonValue &value, core::DateError *error = nullptr);
std::optional<core::RepEnd> repEndFromJson(const QJsonValue &value, core::DateError *error = nullptr);
std::optional<core::Repetition> repetitionFromJson(const QJsonValue &value, core::DateError *error = nullptr);

} // namespace data
} // namespace cadence
