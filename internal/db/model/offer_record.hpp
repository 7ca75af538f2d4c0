#pragma once

#include <cstdint>
#include <string>

#include "dispatch/engine/core/v1/types.pb.h"

namespace dispatch::db::model {

// Append-only: rows are status-transitioned, never deleted.
struct OfferRecord {
  std::string id;
  std::string ride_id;
  std::string driver_id;
  uint32_t    batch_number = 0;

  dispatch::engine::core::v1::OfferStatus status = dispatch::engine::core::v1::OFFER_STATUS_UNSPECIFIED;

  double      distance_km = 0;
  uint32_t    eta_minutes = 0;
  std::string reject_reason;

  uint64_t created_at_ms   = 0;
  uint64_t expires_at_ms   = 0;
  uint64_t responded_at_ms = 0;
};

} // namespace dispatch::db::model
