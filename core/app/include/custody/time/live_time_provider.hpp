#pragma once

#include "custody/time/i_time_provider.hpp"

namespace custody {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock ITimeProvider backed by system_clock
// -----------------------------------------------------------------------------
// Used by the custody_node service. Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace custody
