#pragma once

#include "custody/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace custody {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: explicitly driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose time only moves when advance_by() is called.
//
// @details
// Starts at 0 or at the value given to the constructor. Tests pin it before
// driving transitions and then assert the exact timestamps carried by the
// resulting events.
//
// Thread model: atomic load/store, safe from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Moves the clock forward by delta_ms relative to its current value.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace custody
