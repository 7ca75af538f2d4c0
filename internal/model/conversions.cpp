#include "conversions.hpp"

#include <set>

#include "internal/util/time.hpp"

namespace dispatch::model {

using namespace dispatch::engine::core::v1;
using dispatch::util::SetTimestamp;

Ride ToProto(const dispatch::db::model::RideRecord& r) {
  Ride ride;
  ride.set_id(r.id);
  ride.set_customer_id(r.customer_id);
  *ride.mutable_pickup()  = PickupOf(r);
  *ride.mutable_dropoff() = DropoffOf(r);
  ride.mutable_variant()->set_vehicle_type(r.vehicle_type);
  ride.mutable_variant()->set_service_tier(r.service_tier);
  ride.set_status(r.status);
  *ride.mutable_fare() = FareOf(r);
  ride.set_assigned_driver_id(r.assigned_driver_id);
  ride.set_cancellation_reason(r.cancellation_reason);

  SetTimestamp(r.created_at_ms, ride.mutable_created_at());
  SetTimestamp(r.assigned_at_ms, ride.mutable_assigned_at());
  SetTimestamp(r.arrived_at_ms, ride.mutable_arrived_at());
  SetTimestamp(r.started_at_ms, ride.mutable_started_at());
  SetTimestamp(r.completed_at_ms, ride.mutable_completed_at());
  SetTimestamp(r.cancelled_at_ms, ride.mutable_cancelled_at());
  return ride;
}

Offer ToProto(const dispatch::db::model::OfferRecord& r) {
  Offer offer;
  offer.set_id(r.id);
  offer.set_ride_id(r.ride_id);
  offer.set_driver_id(r.driver_id);
  offer.set_batch_number(r.batch_number);
  offer.set_status(r.status);
  offer.set_distance_km(r.distance_km);
  offer.set_eta_minutes(r.eta_minutes);
  offer.set_reject_reason(r.reject_reason);

  SetTimestamp(r.created_at_ms, offer.mutable_created_at());
  SetTimestamp(r.expires_at_ms, offer.mutable_expires_at());
  SetTimestamp(r.responded_at_ms, offer.mutable_responded_at());
  return offer;
}

RideStatusChange ToProto(const dispatch::db::model::RideHistoryRecord& r) {
  RideStatusChange change;
  change.set_sequence(r.sequence);
  change.set_from_status(r.from_status);
  change.set_to_status(r.to_status);
  change.set_actor(r.actor);
  change.set_reason(r.reason);
  change.set_driver_id(r.driver_id);
  SetTimestamp(r.created_at_ms, change.mutable_created_at());
  return change;
}

GeoPoint PickupOf(const dispatch::db::model::RideRecord& r) {
  GeoPoint p;
  p.set_latitude(r.pickup_lat);
  p.set_longitude(r.pickup_lon);
  p.set_address(r.pickup_address);
  return p;
}

GeoPoint DropoffOf(const dispatch::db::model::RideRecord& r) {
  GeoPoint p;
  p.set_latitude(r.dropoff_lat);
  p.set_longitude(r.dropoff_lon);
  p.set_address(r.dropoff_address);
  return p;
}

FareEstimate FareOf(const dispatch::db::model::RideRecord& r) {
  FareEstimate fare;
  fare.set_amount(r.estimated_fare);
  fare.set_currency(r.currency);
  fare.set_distance_km(r.estimated_distance_km);
  return fare;
}

geo::Coordinates PickupCoordinates(const dispatch::db::model::RideRecord& r) {
  return {r.pickup_lat, r.pickup_lon};
}

geo::Coordinates LocationOf(const dispatch::db::model::DriverAvailabilityRecord& r) {
  return {r.latitude, r.longitude};
}

MatchingStats ComputeMatchingStats(const std::vector<dispatch::db::model::OfferRecord>& offers) {
  MatchingStats stats;
  if (offers.empty()) return stats;

  std::set<uint32_t> batches;
  double             total_distance = 0;
  for (const auto& offer : offers) {
    batches.insert(offer.batch_number);
    total_distance += offer.distance_km;

    switch (offer.status) {
      case OFFER_STATUS_PENDING:
        stats.set_pending(stats.pending() + 1);
        break;
      case OFFER_STATUS_ACCEPTED:
        stats.set_accepted(stats.accepted() + 1);
        break;
      case OFFER_STATUS_REJECTED:
        stats.set_rejected(stats.rejected() + 1);
        break;
      case OFFER_STATUS_EXPIRED:
        stats.set_expired(stats.expired() + 1);
        break;
      case OFFER_STATUS_SUPERSEDED:
        stats.set_superseded(stats.superseded() + 1);
        break;
      default:
        break;
    }
  }

  stats.set_drivers_contacted(static_cast<uint32_t>(offers.size()));
  stats.set_batches_used(static_cast<uint32_t>(batches.size()));
  stats.set_average_distance_km(total_distance / static_cast<double>(offers.size()));
  return stats;
}

} // namespace dispatch::model
