#pragma once

#include "custody/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace custody {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// ITimeProvider speaks epoch milliseconds; events carry a Timestamp
// (system_clock::time_point). The EventLog converts on the way in, the JSON
// codec on the way out. Both are exact inverses at millisecond resolution.
// -----------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace custody
