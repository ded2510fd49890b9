#pragma once
#include "model/Service.hpp"
#include "model/Release.hpp"

namespace sloguard::engine {

// Ten years; compliance windows are typically 7 to 90 days.
inline constexpr int kMaxWindowDays = 3650;

// Each throws ValidationError describing the first violated rule.
void validate_service(const sloguard::model::Service& s);
void validate_target(const sloguard::model::SloTarget& t);
void validate_release_request(const sloguard::model::ReleaseRequest& r);

} // namespace sloguard::engine
