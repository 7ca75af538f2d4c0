#include "events.hpp"

#include "internal/model/conversions.hpp"
#include "internal/util/time.hpp"

namespace dispatch::events {

RealtimeEvent RideRequestNew(const dispatch::db::model::RideRecord& ride, const dispatch::db::model::OfferRecord& offer) {
  RealtimeEvent event;
  event.set_name(std::string(kRideRequestNew));

  auto* body = event.mutable_ride_request_new();
  body->set_ride_id(ride.id);
  body->set_offer_id(offer.id);
  body->set_batch_number(offer.batch_number);
  *body->mutable_pickup()  = model::PickupOf(ride);
  *body->mutable_dropoff() = model::DropoffOf(ride);
  *body->mutable_fare()    = model::FareOf(ride);
  body->set_distance_km(offer.distance_km);
  body->set_eta_minutes(offer.eta_minutes);
  util::SetTimestamp(offer.expires_at_ms, body->mutable_expires_at());
  return event;
}

RealtimeEvent RideRequestCancelled(const std::string& ride_id, std::string_view reason) {
  RealtimeEvent event;
  event.set_name(std::string(kRideRequestCancelled));
  event.mutable_ride_request_cancelled()->set_ride_id(ride_id);
  event.mutable_ride_request_cancelled()->set_reason(std::string(reason));
  return event;
}

RealtimeEvent DriverAssigned(const std::string& ride_id, const std::string& driver_id, uint32_t eta_minutes) {
  RealtimeEvent event;
  event.set_name(std::string(kDriverAssigned));
  event.mutable_driver_assigned()->set_ride_id(ride_id);
  event.mutable_driver_assigned()->set_driver_id(driver_id);
  event.mutable_driver_assigned()->set_eta_minutes(eta_minutes);
  return event;
}

RealtimeEvent NoDriversAvailable(const std::string& ride_id, std::string_view reason) {
  RealtimeEvent event;
  event.set_name(std::string(kNoDriversAvailable));
  event.mutable_no_drivers_available()->set_ride_id(ride_id);
  event.mutable_no_drivers_available()->set_reason(std::string(reason));
  return event;
}

RealtimeEvent RideStatusUpdated(const std::string& ride_id, dispatch::engine::core::v1::RideStatus status, const std::string& actor) {
  RealtimeEvent event;
  event.set_name(std::string(kRideStatusUpdated));
  event.mutable_ride_status_updated()->set_ride_id(ride_id);
  event.mutable_ride_status_updated()->set_status(status);
  event.mutable_ride_status_updated()->set_actor(actor);
  return event;
}

} // namespace dispatch::events
