#pragma once

#include <string>

#include "api/dispatch/engine/v1.hpp"
#include "service_context.hpp"

namespace dispatch::service {

/*
  Customer-facing ride operations plus the assigned driver's lifecycle
  steps (arrived / started / completed).
*/
class RideService {
 public:
  explicit RideService(ServiceContext ctx);

  dispatch::engine::v1::CreateRideResponse CreateRide(const dispatch::engine::v1::CreateRideRequest& req);

  dispatch::engine::v1::CancelRideResponse CancelRide(const dispatch::engine::v1::CancelRideRequest& req);

  dispatch::engine::v1::GetRideStatusResponse GetRideStatus(const dispatch::engine::v1::GetRideStatusRequest& req);

  dispatch::engine::v1::GetOfferHistoryResponse GetOfferHistory(const dispatch::engine::v1::GetOfferHistoryRequest& req);

  dispatch::engine::v1::DriverRideResponse MarkArrived(const dispatch::engine::v1::DriverRideRequest& req);
  dispatch::engine::v1::DriverRideResponse StartTrip(const dispatch::engine::v1::DriverRideRequest& req);
  dispatch::engine::v1::DriverRideResponse CompleteRide(const dispatch::engine::v1::DriverRideRequest& req);

  dispatch::engine::v1::RedispatchResponse Redispatch(const dispatch::engine::v1::RedispatchRequest& req);

 private:
  // Inserts a searching ride with its first history row and starts dispatch.
  void Submit(const dispatch::db::model::RideRecord& ride, const std::string& reason);

  dispatch::engine::v1::DriverRideResponse AdvanceByDriver(const dispatch::engine::v1::DriverRideRequest& req, dispatch::engine::v1::RideStatus to,
                                                           const std::string& reason);

  ServiceContext ctx_;
};

} // namespace dispatch::service
