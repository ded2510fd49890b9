#include "engine/Validation.hpp"
#include "engine/Errors.hpp"
#include "util/Strings.hpp"
#include <cctype>
#include <cmath>
#include <string>

namespace sloguard::engine {

void validate_service(const sloguard::model::Service& s) {
  if (util::is_blank(s.name)) throw ValidationError("service name must not be empty");
  if (s.name.size() > 100) throw ValidationError("service name longer than 100 characters");
  for (char c : s.name) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '/' || c == '?')
      throw ValidationError("service name '" + s.name + "' contains whitespace, '/' or '?'");
  }
  if (s.tier < 1 || s.tier > 3) throw ValidationError("tier must be 1, 2 or 3");
}

void validate_target(const sloguard::model::SloTarget& t) {
  if (util::is_blank(t.name)) throw ValidationError("SLO name must not be empty");
  if (!std::isfinite(t.target_value) || t.target_value <= 0.0 || t.target_value >= 100.0)
    throw ValidationError("target_value must satisfy 0 < target_value < 100");
  if (t.window_days <= 0 || t.window_days > kMaxWindowDays)
    throw ValidationError("window_days must be between 1 and " + std::to_string(kMaxWindowDays));
  if (!std::isfinite(t.burn_rate_threshold) || t.burn_rate_threshold <= 0.0)
    throw ValidationError("burn_rate_threshold must be positive");
  if (!std::isfinite(t.danger_burn_rate) || t.danger_burn_rate < t.burn_rate_threshold)
    throw ValidationError("danger_burn_rate must be >= burn_rate_threshold");
  if (!std::isfinite(t.critical_burn_rate) || t.critical_burn_rate < t.danger_burn_rate)
    throw ValidationError("critical_burn_rate must be >= danger_burn_rate");
}

void validate_release_request(const sloguard::model::ReleaseRequest& r) {
  if (util::is_blank(r.service)) throw ValidationError("service_name is required");
  if (util::is_blank(r.deployment_id)) throw ValidationError("deployment_id is required");
  if (r.override_requested && util::is_blank(r.override_reason))
    throw ValidationError("override requires a non-empty override_reason");
}

} // namespace sloguard::engine
