#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "dispatch/engine/realtime/v1/events.pb.h"
#include "internal/db/model/offer_record.hpp"
#include "internal/db/model/ride_record.hpp"

namespace dispatch::events {

using dispatch::engine::realtime::v1::RealtimeEvent;

// Channel names
inline constexpr std::string_view kRideRequestNew       = "ride:request:new";
inline constexpr std::string_view kRideRequestCancelled = "ride:request:cancelled";
inline constexpr std::string_view kDriverAssigned       = "ride:driver:assigned";
inline constexpr std::string_view kNoDriversAvailable   = "ride:status:no_drivers_available";
inline constexpr std::string_view kRideStatusUpdated    = "ride:status:updated";

// Reasons carried by ride:request:cancelled / no_drivers_available
inline constexpr std::string_view kReasonAcceptedByAnotherDriver = "accepted_by_another_driver";
inline constexpr std::string_view kReasonOfferExpired            = "offer_expired";
inline constexpr std::string_view kReasonRideCancelled           = "ride_cancelled";
inline constexpr std::string_view kReasonNoCandidates            = "no_candidates";
inline constexpr std::string_view kReasonMaxBatchesReached       = "max_batches_reached";
inline constexpr std::string_view kReasonSearchTimeout           = "search_timeout";

RealtimeEvent RideRequestNew(const dispatch::db::model::RideRecord& ride, const dispatch::db::model::OfferRecord& offer);
RealtimeEvent RideRequestCancelled(const std::string& ride_id, std::string_view reason);
RealtimeEvent DriverAssigned(const std::string& ride_id, const std::string& driver_id, uint32_t eta_minutes);
RealtimeEvent NoDriversAvailable(const std::string& ride_id, std::string_view reason);
RealtimeEvent RideStatusUpdated(const std::string& ride_id, dispatch::engine::core::v1::RideStatus status, const std::string& actor);

} // namespace dispatch::events
