#include "driver_server.hpp"

#include "grpc_error.hpp"

namespace dispatch::grpc {

DriverServer::DriverServer(std::shared_ptr<dispatch::service::DriverService> svc) : service_(std::move(svc)) {
}

::grpc::Status DriverServer::AcceptOffer(::grpc::ServerContext*, const dispatch::engine::v1::AcceptOfferRequest* req, dispatch::engine::v1::AcceptOfferResponse* resp) {
  try {
    *resp = service_->AcceptOffer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::RejectOffer(::grpc::ServerContext*, const dispatch::engine::v1::RejectOfferRequest* req, dispatch::engine::v1::RejectOfferResponse* resp) {
  try {
    *resp = service_->RejectOffer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::UpdateLocation(::grpc::ServerContext*, const dispatch::engine::v1::UpdateLocationRequest* req, dispatch::engine::v1::UpdateLocationResponse*) {
  try {
    service_->UpdateLocation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::SetAvailability(::grpc::ServerContext*, const dispatch::engine::v1::SetAvailabilityRequest* req, dispatch::engine::v1::SetAvailabilityResponse* resp) {
  try {
    *resp = service_->SetAvailability(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::ListPendingOffers(::grpc::ServerContext*, const dispatch::engine::v1::ListPendingOffersRequest* req, dispatch::engine::v1::ListPendingOffersResponse* resp) {
  try {
    *resp = service_->ListPendingOffers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace dispatch::grpc
