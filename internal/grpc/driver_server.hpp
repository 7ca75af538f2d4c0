#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "api/dispatch/engine/v1.hpp"
#include "internal/service/driver_service.hpp"

namespace dispatch::grpc {

class DriverServer final : public dispatch::engine::v1::DriverService::Service {
 public:
  explicit DriverServer(std::shared_ptr<dispatch::service::DriverService> svc);

  ::grpc::Status AcceptOffer(::grpc::ServerContext*, const dispatch::engine::v1::AcceptOfferRequest*, dispatch::engine::v1::AcceptOfferResponse*) override;

  ::grpc::Status RejectOffer(::grpc::ServerContext*, const dispatch::engine::v1::RejectOfferRequest*, dispatch::engine::v1::RejectOfferResponse*) override;

  ::grpc::Status UpdateLocation(::grpc::ServerContext*, const dispatch::engine::v1::UpdateLocationRequest*, dispatch::engine::v1::UpdateLocationResponse*) override;

  ::grpc::Status SetAvailability(::grpc::ServerContext*, const dispatch::engine::v1::SetAvailabilityRequest*, dispatch::engine::v1::SetAvailabilityResponse*) override;

  ::grpc::Status ListPendingOffers(::grpc::ServerContext*, const dispatch::engine::v1::ListPendingOffersRequest*, dispatch::engine::v1::ListPendingOffersResponse*) override;

 private:
  std::shared_ptr<dispatch::service::DriverService> service_;
};

} // namespace dispatch::grpc
