#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "api/dispatch/engine/v1.hpp"
#include "internal/service/ride_service.hpp"

namespace dispatch::grpc {

class RideServer final : public dispatch::engine::v1::RideService::Service {
 public:
  explicit RideServer(std::shared_ptr<dispatch::service::RideService> svc);

  ::grpc::Status CreateRide(::grpc::ServerContext*, const dispatch::engine::v1::CreateRideRequest*, dispatch::engine::v1::CreateRideResponse*) override;

  ::grpc::Status CancelRide(::grpc::ServerContext*, const dispatch::engine::v1::CancelRideRequest*, dispatch::engine::v1::CancelRideResponse*) override;

  ::grpc::Status GetRideStatus(::grpc::ServerContext*, const dispatch::engine::v1::GetRideStatusRequest*, dispatch::engine::v1::GetRideStatusResponse*) override;

  ::grpc::Status GetOfferHistory(::grpc::ServerContext*, const dispatch::engine::v1::GetOfferHistoryRequest*, dispatch::engine::v1::GetOfferHistoryResponse*) override;

  ::grpc::Status MarkArrived(::grpc::ServerContext*, const dispatch::engine::v1::DriverRideRequest*, dispatch::engine::v1::DriverRideResponse*) override;

  ::grpc::Status StartTrip(::grpc::ServerContext*, const dispatch::engine::v1::DriverRideRequest*, dispatch::engine::v1::DriverRideResponse*) override;

  ::grpc::Status CompleteRide(::grpc::ServerContext*, const dispatch::engine::v1::DriverRideRequest*, dispatch::engine::v1::DriverRideResponse*) override;

  ::grpc::Status Redispatch(::grpc::ServerContext*, const dispatch::engine::v1::RedispatchRequest*, dispatch::engine::v1::RedispatchResponse*) override;

 private:
  std::shared_ptr<dispatch::service::RideService> service_;
};

} // namespace dispatch::grpc
