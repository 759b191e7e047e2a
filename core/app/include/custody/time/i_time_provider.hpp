#pragma once

#include <cstdint>

namespace custody {

// -----------------------------------------------------------------------------
// ITimeProvider: injectable clock
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for event timestamps.
//
// @details
// The EventLog stamps every appended event with now_ms(). The service wires
// a LiveTimeProvider; tests wire a SimulationTimeProvider so timestamps are
// deterministic and assertions can compare exact values.
//
// Ownership: borrowed by const reference. The provider must outlive every
// component holding it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch. Safe to call from any thread.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace custody
