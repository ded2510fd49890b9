#pragma once

#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/Summary.hpp"
#include "model/Alert.hpp"
#include "model/Evaluation.hpp"
#include "model/Forecast.hpp"
#include "model/Release.hpp"
#include "model/Sample.hpp"
#include "model/Service.hpp"

// Encoders live beside their types so nlohmann's ADL lookup finds them.
namespace sloguard::model {

void to_json(nlohmann::json& j, const Service& s);
void to_json(nlohmann::json& j, const SloTarget& t);
void to_json(nlohmann::json& j, const BurnRateSnapshot& s);
void to_json(nlohmann::json& j, const Forecast& f);
void to_json(nlohmann::json& j, const ReleaseDecision& d);
void to_json(nlohmann::json& j, const Alert& a);

} // namespace sloguard::model

namespace sloguard::engine {

void to_json(nlohmann::json& j, const Overview& o);
void to_json(nlohmann::json& j, const ServiceSummary& s);
void to_json(nlohmann::json& j, const Heatmap& h);
void to_json(nlohmann::json& j, const GateStatistics& g);
void to_json(nlohmann::json& j, const AlertStatistics& a);
void to_json(nlohmann::json& j, const GlobalCompliance& g);

} // namespace sloguard::engine

namespace sloguard::app {

// Decoders. Malformed or mistyped fields throw engine::ValidationError.
[[nodiscard]] nlohmann::json parse_body(const std::string& body);

[[nodiscard]] sloguard::model::Service service_from_json(const nlohmann::json& j);
// Overwrites only the fields present in `j`; the name is immutable.
void apply_service_update(sloguard::model::Service& s, const nlohmann::json& j);

[[nodiscard]] sloguard::model::SloTarget target_from_json(const nlohmann::json& j, const std::string& service);
void apply_target_update(sloguard::model::SloTarget& t, const nlohmann::json& j);

// `service` non-empty takes precedence over a "service_name" field.
[[nodiscard]] sloguard::model::ReleaseRequest release_request_from_json(const nlohmann::json& j,
                                                                        const std::string& service = "");

// {"samples":[{"service","timestamp","success_count"|"total_requests","error_count"}]}
[[nodiscard]] std::vector<std::pair<std::string, sloguard::model::Sample>> samples_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json error_json(const std::string& kind, const std::string& detail);

} // namespace sloguard::app
