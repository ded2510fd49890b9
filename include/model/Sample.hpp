#pragma once
#include <cstdint>
#include "model/Types.hpp"

namespace sloguard::model {

// One observation of request outcomes for a service.
struct Sample {
  Timestamp ts{};
  uint64_t success{};
  uint64_t errors{};

  [[nodiscard]] uint64_t total() const { return success + errors; }
};

} // namespace sloguard::model
