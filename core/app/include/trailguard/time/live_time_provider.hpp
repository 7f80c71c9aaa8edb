#pragma once

#include "trailguard/time/i_time_provider.hpp"

namespace trailguard {

// System clock, used by the production binary.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace trailguard
