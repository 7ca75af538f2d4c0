#pragma once

#include <cstdint>
#include <string>

#include "dispatch/engine/core/v1/types.pb.h"

namespace dispatch::db::model {

struct RideHistoryRecord {
  std::string ride_id;
  uint64_t    sequence = 0; // assigned by the repository, 1-based per ride

  dispatch::engine::core::v1::RideStatus from_status = dispatch::engine::core::v1::RIDE_STATUS_UNSPECIFIED;
  dispatch::engine::core::v1::RideStatus to_status   = dispatch::engine::core::v1::RIDE_STATUS_UNSPECIFIED;

  std::string actor;
  std::string reason;
  std::string driver_id;
  uint64_t    created_at_ms = 0;
};

} // namespace dispatch::db::model
