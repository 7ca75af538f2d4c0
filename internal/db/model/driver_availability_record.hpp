#pragma once

#include <cstdint>
#include <string>

namespace dispatch::db::model {

/*
  Durable mirror of driver presence plus the attributes used for ranking.

  is_available=false drivers are never dispatch candidates.
*/
struct DriverAvailabilityRecord {
  std::string driver_id;

  bool is_online    = false;
  bool is_available = false;

  bool   has_location = false;
  double latitude     = 0;
  double longitude    = 0;

  uint64_t last_seen_at_ms = 0;

  std::string vehicle_type;
  std::string service_tier;
  double      rating          = 0;
  uint32_t    completed_rides = 0;

  // Start of the current idle period; 0 while busy or offline.
  uint64_t available_since_ms = 0;
};

} // namespace dispatch::db::model
