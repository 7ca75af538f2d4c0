#include "ride_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/db/api/throw_if_error.hpp"
#include "internal/events/event_outbox.hpp"
#include "internal/matching/batch_scheduler.hpp"
#include "internal/matching/ride_state_machine.hpp"
#include "internal/model/conversions.hpp"
#include "internal/model/ride_status.hpp"
#include "internal/pricing/fare_estimator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "observe_rpc.hpp"

namespace dispatch::service {

using namespace dispatch::engine::v1;

namespace {

constexpr const char* kDefaultCancelReason = "customer_cancelled";

void ValidatePoint(const GeoPoint& point, const std::string& field) {
  if (point.latitude() < -90.0 || point.latitude() > 90.0 || point.longitude() < -180.0 || point.longitude() > 180.0) {
    throw dispatch::util::InvalidArgument(field + " is outside the valid coordinate range");
  }
}

void RequireField(const std::string& value, const std::string& field) {
  if (value.empty()) {
    throw dispatch::util::InvalidArgument(field + " is required");
  }
}

dispatch::db::model::RideRecord LoadRide(dispatch::db::Repository& repository, dispatch::db::Transaction& tx, const std::string& ride_id) {
  auto ride = repository.GetRide(tx, ride_id);
  if (!ride) {
    throw dispatch::util::NotFound("ride not found: " + ride_id);
  }
  return *ride;
}

// Holds the ride row until the transaction ends; required before writing its offers.
dispatch::db::model::RideRecord LockRide(dispatch::db::Repository& repository, dispatch::db::Transaction& tx, const std::string& ride_id) {
  auto ride = repository.GetRideForUpdate(tx, ride_id);
  if (!ride) {
    throw dispatch::util::NotFound("ride not found: " + ride_id);
  }
  return *ride;
}

std::string Describe(RideStatus status) {
  switch (status) {
    case RIDE_STATUS_SEARCHING:
      return "Looking for a driver";
    case RIDE_STATUS_ASSIGNED:
      return "Driver is on the way";
    case RIDE_STATUS_ARRIVED:
      return "Driver has arrived at pickup";
    case RIDE_STATUS_IN_PROGRESS:
      return "Trip in progress";
    case RIDE_STATUS_COMPLETED:
      return "Trip completed";
    case RIDE_STATUS_CANCELLED:
      return "Ride cancelled";
    case RIDE_STATUS_NO_DRIVERS_AVAILABLE:
      return "No drivers available";
    default:
      return "Unknown";
  }
}

} // namespace

RideService::RideService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void RideService::Submit(const dispatch::db::model::RideRecord& ride, const std::string& reason) {
  auto tx = ctx_.repository->Begin();
  dispatch::db::ThrowIfError(ctx_.repository->InsertRide(*tx, ride), "insert ride " + ride.id);

  dispatch::db::model::RideHistoryRecord history;
  history.ride_id       = ride.id;
  history.from_status   = RIDE_STATUS_UNSPECIFIED;
  history.to_status     = RIDE_STATUS_SEARCHING;
  history.actor         = "customer";
  history.reason        = reason;
  history.created_at_ms = ride.created_at_ms;
  dispatch::db::ThrowIfError(ctx_.repository->AppendRideHistory(*tx, history), "append history for ride " + ride.id);
  tx->Commit();

  ctx_.scheduler->ScheduleRide(ride.id);

  DISPATCH_LOG_INFO("Ride requested", {dispatch::observability::StringField("ride_id", ride.id),
                                       dispatch::observability::StringField("customer_id", ride.customer_id),
                                       dispatch::observability::DoubleField("estimated_fare", ride.estimated_fare)});
}

CreateRideResponse RideService::CreateRide(const CreateRideRequest& req) {
  return ObserveRpc("RideService.CreateRide", "", [&] {
    RequireField(req.customer_id(), "customer_id");
    if (!req.has_pickup() || !req.has_dropoff()) {
      throw dispatch::util::InvalidArgument("pickup and dropoff are required");
    }
    ValidatePoint(req.pickup(), "pickup");
    ValidatePoint(req.dropoff(), "dropoff");

    const auto fare = ctx_.fare_estimator->Estimate(req.pickup(), req.dropoff(), req.variant());

    dispatch::db::model::RideRecord ride;
    ride.id                    = dispatch::util::NewId();
    ride.customer_id           = req.customer_id();
    ride.pickup_lat            = req.pickup().latitude();
    ride.pickup_lon            = req.pickup().longitude();
    ride.pickup_address        = req.pickup().address();
    ride.dropoff_lat           = req.dropoff().latitude();
    ride.dropoff_lon           = req.dropoff().longitude();
    ride.dropoff_address       = req.dropoff().address();
    ride.vehicle_type          = req.variant().vehicle_type();
    ride.service_tier          = req.variant().service_tier();
    ride.status                = RIDE_STATUS_SEARCHING;
    ride.estimated_fare        = fare.amount();
    ride.currency              = fare.currency();
    ride.estimated_distance_km = fare.distance_km();
    ride.created_at_ms         = dispatch::util::NowMillis();

    Submit(ride, "ride_requested");

    CreateRideResponse resp;
    resp.set_ride_id(ride.id);
    *resp.mutable_fare() = fare;
    return resp;
  });
}

CancelRideResponse RideService::CancelRide(const CancelRideRequest& req) {
  return ObserveRpc("RideService.CancelRide", req.ride_id(), [&] {
    RequireField(req.ride_id(), "ride_id");
    RequireField(req.customer_id(), "customer_id");
    const std::string reason = req.reason().empty() ? kDefaultCancelReason : req.reason();

    std::vector<dispatch::db::model::OfferRecord> expired;
    dispatch::db::model::RideRecord               cancelled;
    std::string                                   released_driver;
    {
      auto tx   = ctx_.repository->Begin();
      auto ride = LockRide(*ctx_.repository, *tx, req.ride_id());
      if (ride.customer_id != req.customer_id()) {
        throw dispatch::util::PermissionDenied("ride " + ride.id + " belongs to another customer");
      }

      released_driver = ride.assigned_driver_id;
      cancelled       = ctx_.state_machine->ApplyInTransaction(*tx, ride, RIDE_STATUS_CANCELLED, {"customer", reason, ""}, dispatch::util::NowMillis());
      dispatch::db::ThrowIfError(
          ctx_.repository->ResolvePendingOffersForRide(*tx, ride.id, std::nullopt, OFFER_STATUS_EXPIRED, dispatch::util::NowMillis(), expired),
          "expire offers for ride " + ride.id);
      tx->Commit();
    }

    ctx_.scheduler->OnRideSettled(cancelled.id);

    std::vector<dispatch::events::Notification> notifications;
    for (const auto& offer : expired) {
      notifications.push_back({offer.driver_id, dispatch::events::RideRequestCancelled(cancelled.id, dispatch::events::kReasonRideCancelled)});
    }
    if (!released_driver.empty()) {
      notifications.push_back({released_driver, dispatch::events::RideRequestCancelled(cancelled.id, dispatch::events::kReasonRideCancelled)});
    }
    ctx_.outbox->Publish(std::move(notifications));

    DISPATCH_LOG_INFO("Ride cancelled", {dispatch::observability::StringField("ride_id", cancelled.id), dispatch::observability::StringField("reason", reason),
                                         dispatch::observability::IntField("offers_expired", static_cast<int64_t>(expired.size()))});

    CancelRideResponse resp;
    *resp.mutable_ride() = dispatch::model::ToProto(cancelled);
    return resp;
  });
}

GetRideStatusResponse RideService::GetRideStatus(const GetRideStatusRequest& req) {
  return ObserveRpc("RideService.GetRideStatus", req.ride_id(), [&] {
    RequireField(req.ride_id(), "ride_id");

    auto tx   = ctx_.repository->Begin();
    auto ride = LoadRide(*ctx_.repository, *tx, req.ride_id());
    tx->Commit();

    GetRideStatusResponse resp;
    *resp.mutable_ride() = dispatch::model::ToProto(ride);
    resp.set_description(Describe(ride.status));
    return resp;
  });
}

GetOfferHistoryResponse RideService::GetOfferHistory(const GetOfferHistoryRequest& req) {
  return ObserveRpc("RideService.GetOfferHistory", req.ride_id(), [&] {
    RequireField(req.ride_id(), "ride_id");

    auto tx = ctx_.repository->Begin();
    LoadRide(*ctx_.repository, *tx, req.ride_id());
    auto offers  = ctx_.repository->ListOffersForRide(*tx, req.ride_id());
    auto history = ctx_.repository->ListRideHistory(*tx, req.ride_id());
    tx->Commit();

    GetOfferHistoryResponse resp;
    for (const auto& offer : offers) {
      *resp.add_offers() = dispatch::model::ToProto(offer);
    }
    for (const auto& entry : history) {
      *resp.add_history() = dispatch::model::ToProto(entry);
    }
    *resp.mutable_stats() = dispatch::model::ComputeMatchingStats(offers);
    return resp;
  });
}

DriverRideResponse RideService::AdvanceByDriver(const DriverRideRequest& req, RideStatus to, const std::string& reason) {
  RequireField(req.ride_id(), "ride_id");
  RequireField(req.driver_id(), "driver_id");

  dispatch::db::model::RideRecord updated;
  {
    auto tx   = ctx_.repository->Begin();
    auto ride = LoadRide(*ctx_.repository, *tx, req.ride_id());
    if (ride.assigned_driver_id != req.driver_id()) {
      throw dispatch::util::PermissionDenied("driver " + req.driver_id() + " is not assigned to ride " + ride.id);
    }

    const uint64_t now_ms = dispatch::util::NowMillis();
    updated               = ctx_.state_machine->ApplyInTransaction(*tx, ride, to, {"driver", reason, req.driver_id()}, now_ms);

    if (to == RIDE_STATUS_COMPLETED) {
      if (auto driver = ctx_.repository->GetDriverAvailability(*tx, req.driver_id())) {
        driver->completed_rides += 1;
        dispatch::db::ThrowIfError(ctx_.repository->UpsertDriverAvailability(*tx, *driver), "count completed ride for driver " + req.driver_id());
      }
    }
    tx->Commit();
  }

  ctx_.outbox->Publish(updated.customer_id, dispatch::events::RideStatusUpdated(updated.id, to, "driver"));

  DriverRideResponse resp;
  *resp.mutable_ride() = dispatch::model::ToProto(updated);
  return resp;
}

DriverRideResponse RideService::MarkArrived(const DriverRideRequest& req) {
  return ObserveRpc("RideService.MarkArrived", req.ride_id(), [&] { return AdvanceByDriver(req, RIDE_STATUS_ARRIVED, "driver_arrived"); });
}

DriverRideResponse RideService::StartTrip(const DriverRideRequest& req) {
  return ObserveRpc("RideService.StartTrip", req.ride_id(), [&] { return AdvanceByDriver(req, RIDE_STATUS_IN_PROGRESS, "trip_started"); });
}

DriverRideResponse RideService::CompleteRide(const DriverRideRequest& req) {
  return ObserveRpc("RideService.CompleteRide", req.ride_id(), [&] { return AdvanceByDriver(req, RIDE_STATUS_COMPLETED, "trip_completed"); });
}

RedispatchResponse RideService::Redispatch(const RedispatchRequest& req) {
  return ObserveRpc("RideService.Redispatch", req.ride_id(), [&] {
    RequireField(req.ride_id(), "ride_id");
    RequireField(req.customer_id(), "customer_id");

    dispatch::db::model::RideRecord previous;
    {
      auto tx  = ctx_.repository->Begin();
      previous = LoadRide(*ctx_.repository, *tx, req.ride_id());
      tx->Commit();
    }
    if (previous.customer_id != req.customer_id()) {
      throw dispatch::util::PermissionDenied("ride " + previous.id + " belongs to another customer");
    }
    if (previous.status != RIDE_STATUS_NO_DRIVERS_AVAILABLE && previous.status != RIDE_STATUS_CANCELLED) {
      throw dispatch::util::InvalidTransition("ride " + previous.id + " cannot be redispatched from " +
                                              std::string(dispatch::model::ToString(previous.status)));
    }

    dispatch::db::model::RideRecord ride;
    ride.id                    = dispatch::util::NewId();
    ride.customer_id           = previous.customer_id;
    ride.pickup_lat            = previous.pickup_lat;
    ride.pickup_lon            = previous.pickup_lon;
    ride.pickup_address        = previous.pickup_address;
    ride.dropoff_lat           = previous.dropoff_lat;
    ride.dropoff_lon           = previous.dropoff_lon;
    ride.dropoff_address       = previous.dropoff_address;
    ride.vehicle_type          = previous.vehicle_type;
    ride.service_tier          = previous.service_tier;
    ride.status                = RIDE_STATUS_SEARCHING;
    ride.estimated_fare        = previous.estimated_fare;
    ride.currency              = previous.currency;
    ride.estimated_distance_km = previous.estimated_distance_km;
    ride.created_at_ms         = dispatch::util::NowMillis();

    Submit(ride, "redispatch_of:" + previous.id);

    RedispatchResponse resp;
    resp.set_ride_id(ride.id);
    return resp;
  });
}

} // namespace dispatch::service
