#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include "model/Types.hpp"

namespace sloguard::util {

// ISO-8601 UTC with second precision: 2024-05-01T12:00:00Z
[[nodiscard]] std::string format_iso8601(sloguard::model::Timestamp t);

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an optional
// "Z" or "+00:00" suffix; a space may replace the 'T'. Non-UTC offsets are applied.
[[nodiscard]] std::optional<sloguard::model::Timestamp> parse_iso8601(std::string_view s);

// Accepted instants are [1970-01-01, 2100-01-01) UTC; anything later would
// overflow the nanosecond clock a few centuries on.
inline constexpr std::time_t kMaxEpochSeconds = 4102444800;

// Epoch seconds (fractional allowed) to a timestamp; nullopt when not finite
// or outside the accepted range.
[[nodiscard]] std::optional<sloguard::model::Timestamp> from_epoch_seconds(double seconds);

// Start of the UTC hour containing t.
[[nodiscard]] sloguard::model::Timestamp floor_to_hour(sloguard::model::Timestamp t);

} // namespace sloguard::util
