#pragma once

#include <string>

namespace dispatch::matching {

// Told when a ride leaves `searching` through acceptance or cancellation.
class SettlementListener {
 public:
  virtual ~SettlementListener() = default;

  virtual void OnRideSettled(const std::string& ride_id) = 0;
};

} // namespace dispatch::matching
