#pragma once

#include <string_view>

#include "dispatch/engine/core/v1/types.pb.h"

namespace dispatch::model {

using dispatch::engine::core::v1::OfferStatus;
using dispatch::engine::core::v1::RideStatus;

/*
  Ride lifecycle rules.

    searching -> assigned -> arrived -> in_progress -> completed
    searching -> no_drivers_available
    {searching, assigned, arrived} -> cancelled
*/

constexpr bool IsTerminal(RideStatus status) {
  return status == dispatch::engine::core::v1::RIDE_STATUS_COMPLETED || status == dispatch::engine::core::v1::RIDE_STATUS_CANCELLED ||
         status == dispatch::engine::core::v1::RIDE_STATUS_NO_DRIVERS_AVAILABLE;
}

// A driver is bound to the ride in these states.
constexpr bool HoldsDriver(RideStatus status) {
  return status == dispatch::engine::core::v1::RIDE_STATUS_ASSIGNED || status == dispatch::engine::core::v1::RIDE_STATUS_ARRIVED ||
         status == dispatch::engine::core::v1::RIDE_STATUS_IN_PROGRESS || status == dispatch::engine::core::v1::RIDE_STATUS_COMPLETED;
}

constexpr bool CanTransition(RideStatus from, RideStatus to) {
  using namespace dispatch::engine::core::v1;

  switch (from) {
    case RIDE_STATUS_SEARCHING:
      return to == RIDE_STATUS_ASSIGNED || to == RIDE_STATUS_NO_DRIVERS_AVAILABLE || to == RIDE_STATUS_CANCELLED;
    case RIDE_STATUS_ASSIGNED:
      return to == RIDE_STATUS_ARRIVED || to == RIDE_STATUS_CANCELLED;
    case RIDE_STATUS_ARRIVED:
      return to == RIDE_STATUS_IN_PROGRESS || to == RIDE_STATUS_CANCELLED;
    case RIDE_STATUS_IN_PROGRESS:
      return to == RIDE_STATUS_COMPLETED;
    default:
      return false;
  }
}

constexpr std::string_view ToString(RideStatus status) {
  using namespace dispatch::engine::core::v1;

  switch (status) {
    case RIDE_STATUS_SEARCHING:
      return "searching";
    case RIDE_STATUS_ASSIGNED:
      return "assigned";
    case RIDE_STATUS_ARRIVED:
      return "arrived";
    case RIDE_STATUS_IN_PROGRESS:
      return "in_progress";
    case RIDE_STATUS_COMPLETED:
      return "completed";
    case RIDE_STATUS_CANCELLED:
      return "cancelled";
    case RIDE_STATUS_NO_DRIVERS_AVAILABLE:
      return "no_drivers_available";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(OfferStatus status) {
  using namespace dispatch::engine::core::v1;

  switch (status) {
    case OFFER_STATUS_PENDING:
      return "pending";
    case OFFER_STATUS_ACCEPTED:
      return "accepted";
    case OFFER_STATUS_REJECTED:
      return "rejected";
    case OFFER_STATUS_EXPIRED:
      return "expired";
    case OFFER_STATUS_SUPERSEDED:
      return "superseded";
    default:
      return "unspecified";
  }
}

} // namespace dispatch::model
