#include "driver_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/db/api/throw_if_error.hpp"
#include "internal/matching/acceptance_arbitrator.hpp"
#include "internal/model/conversions.hpp"
#include "internal/realtime/connection_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace dispatch::service {

using namespace dispatch::engine::v1;

namespace {

void RequireDriver(const std::string& driver_id) {
  if (driver_id.empty()) {
    throw dispatch::util::InvalidArgument("driver_id is required");
  }
}

} // namespace

DriverService::DriverService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

AcceptOfferResponse DriverService::AcceptOffer(const AcceptOfferRequest& req) {
  return ObserveRpc("DriverService.AcceptOffer", "", [&] {
    RequireDriver(req.driver_id());
    if (req.offer_id().empty()) {
      throw dispatch::util::InvalidArgument("offer_id is required");
    }

    const auto result = ctx_.arbitrator->AcceptOffer(req.offer_id(), req.driver_id());

    AcceptOfferResponse resp;
    resp.set_outcome(result.outcome);
    resp.set_ride_id(result.ride_id);
    resp.set_message(result.message);
    return resp;
  });
}

RejectOfferResponse DriverService::RejectOffer(const RejectOfferRequest& req) {
  return ObserveRpc("DriverService.RejectOffer", "", [&] {
    RequireDriver(req.driver_id());
    if (req.offer_id().empty()) {
      throw dispatch::util::InvalidArgument("offer_id is required");
    }

    RejectOfferResponse resp;
    resp.set_recorded(ctx_.arbitrator->RejectOffer(req.offer_id(), req.driver_id(), req.reason()));
    resp.set_message(resp.recorded() ? "offer rejected" : "offer is no longer pending");
    return resp;
  });
}

void DriverService::UpdateLocation(const UpdateLocationRequest& req) {
  ObserveRpc("DriverService.UpdateLocation", "", [&] {
    RequireDriver(req.driver_id());
    const auto& location = req.location();
    if (!req.has_location() || location.latitude() < -90.0 || location.latitude() > 90.0 || location.longitude() < -180.0 ||
        location.longitude() > 180.0) {
      throw dispatch::util::InvalidArgument("location is missing or outside the valid coordinate range");
    }

    const uint64_t now_ms = dispatch::util::NowMillis();
    auto           tx     = ctx_.repository->Begin();
    auto           result = ctx_.repository->TouchDriverLocation(*tx, req.driver_id(), location.latitude(), location.longitude(), now_ms);
    if (result.code == dispatch::db::ErrorCode::NotFound) {
      dispatch::db::model::DriverAvailabilityRecord driver;
      driver.driver_id          = req.driver_id();
      driver.is_online          = ctx_.registry->IsOnline(req.driver_id());
      driver.is_available       = true;
      driver.has_location       = true;
      driver.latitude           = location.latitude();
      driver.longitude          = location.longitude();
      driver.last_seen_at_ms    = now_ms;
      driver.available_since_ms = now_ms;
      result                    = ctx_.repository->UpsertDriverAvailability(*tx, driver);
    }
    dispatch::db::ThrowIfError(result, "update location for driver " + req.driver_id());
    tx->Commit();
  });
}

SetAvailabilityResponse DriverService::SetAvailability(const SetAvailabilityRequest& req) {
  return ObserveRpc("DriverService.SetAvailability", "", [&] {
    RequireDriver(req.driver_id());

    const uint64_t now_ms = dispatch::util::NowMillis();
    auto           tx     = ctx_.repository->Begin();
    auto           active = ctx_.repository->FindActiveRideForDriver(*tx, req.driver_id());
    if (!req.online() && active) {
      throw dispatch::util::InvalidTransition("driver " + req.driver_id() + " cannot go offline during ride " + active->id);
    }

    auto driver      = ctx_.repository->GetDriverAvailability(*tx, req.driver_id()).value_or(dispatch::db::model::DriverAvailabilityRecord{});
    driver.driver_id = req.driver_id();
    driver.is_online = req.online();
    if (!req.variant().vehicle_type().empty()) driver.vehicle_type = req.variant().vehicle_type();
    if (!req.variant().service_tier().empty()) driver.service_tier = req.variant().service_tier();
    if (req.rating() > 0) driver.rating = req.rating();
    if (req.completed_rides() > 0) driver.completed_rides = req.completed_rides();

    const bool available = req.online() && !active;
    if (!available) {
      driver.available_since_ms = 0;
    } else if (!driver.is_available) {
      driver.available_since_ms = now_ms;
    }
    driver.is_available    = available;
    driver.last_seen_at_ms = now_ms;

    dispatch::db::ThrowIfError(ctx_.repository->UpsertDriverAvailability(*tx, driver), "set availability for driver " + req.driver_id());
    tx->Commit();

    DISPATCH_LOG_INFO("Driver availability changed", {dispatch::observability::StringField("driver_id", driver.driver_id),
                                                      dispatch::observability::BoolField("online", driver.is_online),
                                                      dispatch::observability::BoolField("available", driver.is_available)});

    SetAvailabilityResponse resp;
    resp.set_online(driver.is_online);
    resp.set_available(driver.is_available);
    return resp;
  });
}

ListPendingOffersResponse DriverService::ListPendingOffers(const ListPendingOffersRequest& req) {
  return ObserveRpc("DriverService.ListPendingOffers", "", [&] {
    RequireDriver(req.driver_id());

    auto tx     = ctx_.repository->Begin();
    auto offers = ctx_.repository->ListPendingOffersForDriver(*tx, req.driver_id(), dispatch::util::NowMillis());
    tx->Commit();

    ListPendingOffersResponse resp;
    for (const auto& offer : offers) {
      *resp.add_offers() = dispatch::model::ToProto(offer);
    }
    return resp;
  });
}

} // namespace dispatch::service
