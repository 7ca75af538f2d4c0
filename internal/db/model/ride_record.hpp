#pragma once

#include <cstdint>
#include <string>

#include "dispatch/engine/core/v1/types.pb.h"

namespace dispatch::db::model {

/*
  Persistent ride row.

  IMPORTANT:
  - status is only written through compare-and-set (UpdateRideIfStatus).
  - assigned_driver_id is empty unless status holds a driver.
  - Timestamps are unix millis, 0 = not reached.
*/

struct RideRecord {
  std::string id;
  std::string customer_id;

  double      pickup_lat = 0;
  double      pickup_lon = 0;
  std::string pickup_address;

  double      dropoff_lat = 0;
  double      dropoff_lon = 0;
  std::string dropoff_address;

  std::string vehicle_type;
  std::string service_tier;

  dispatch::engine::core::v1::RideStatus status = dispatch::engine::core::v1::RIDE_STATUS_UNSPECIFIED;

  double      estimated_fare        = 0;
  std::string currency;
  double      estimated_distance_km = 0;

  std::string assigned_driver_id;

  uint64_t created_at_ms   = 0;
  uint64_t assigned_at_ms  = 0;
  uint64_t arrived_at_ms   = 0;
  uint64_t started_at_ms   = 0;
  uint64_t completed_at_ms = 0;
  uint64_t cancelled_at_ms = 0;

  std::string cancellation_reason;
};

} // namespace dispatch::db::model
