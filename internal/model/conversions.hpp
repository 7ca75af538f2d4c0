#pragma once

#include <vector>

#include "dispatch/engine/core/v1/ride.pb.h"
#include "internal/db/model/driver_availability_record.hpp"
#include "internal/db/model/offer_record.hpp"
#include "internal/db/model/ride_history_record.hpp"
#include "internal/db/model/ride_record.hpp"
#include "internal/geo/geo_service.hpp"

namespace dispatch::model {

// Row <-> wire mappings.

dispatch::engine::core::v1::Ride             ToProto(const dispatch::db::model::RideRecord& record);
dispatch::engine::core::v1::Offer            ToProto(const dispatch::db::model::OfferRecord& record);
dispatch::engine::core::v1::RideStatusChange ToProto(const dispatch::db::model::RideHistoryRecord& record);

dispatch::engine::core::v1::GeoPoint    PickupOf(const dispatch::db::model::RideRecord& record);
dispatch::engine::core::v1::GeoPoint    DropoffOf(const dispatch::db::model::RideRecord& record);
dispatch::engine::core::v1::FareEstimate FareOf(const dispatch::db::model::RideRecord& record);

geo::Coordinates PickupCoordinates(const dispatch::db::model::RideRecord& record);
geo::Coordinates LocationOf(const dispatch::db::model::DriverAvailabilityRecord& record);

dispatch::engine::core::v1::MatchingStats ComputeMatchingStats(const std::vector<dispatch::db::model::OfferRecord>& offers);

} // namespace dispatch::model
