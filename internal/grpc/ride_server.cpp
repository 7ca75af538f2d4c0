#include "ride_server.hpp"

#include "grpc_error.hpp"

namespace dispatch::grpc {

RideServer::RideServer(std::shared_ptr<dispatch::service::RideService> svc) : service_(std::move(svc)) {
}

::grpc::Status RideServer::CreateRide(::grpc::ServerContext*, const dispatch::engine::v1::CreateRideRequest* req, dispatch::engine::v1::CreateRideResponse* resp) {
  try {
    *resp = service_->CreateRide(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RideServer::CancelRide(::grpc::ServerContext*, const dispatch::engine::v1::CancelRideRequest* req, dispatch::engine::v1::CancelRideResponse* resp) {
  try {
    *resp = service_->CancelRide(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RideServer::GetRideStatus(::grpc::ServerContext*, const dispatch::engine::v1::GetRideStatusRequest* req, dispatch::engine::v1::GetRideStatusResponse* resp) {
  try {
    *resp = service_->GetRideStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RideServer::GetOfferHistory(::grpc::ServerContext*, const dispatch::engine::v1::GetOfferHistoryRequest* req, dispatch::engine::v1::GetOfferHistoryResponse* resp) {
  try {
    *resp = service_->GetOfferHistory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RideServer::MarkArrived(::grpc::ServerContext*, const dispatch::engine::v1::DriverRideRequest* req, dispatch::engine::v1::DriverRideResponse* resp) {
  try {
    *resp = service_->MarkArrived(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RideServer::StartTrip(::grpc::ServerContext*, const dispatch::engine::v1::DriverRideRequest* req, dispatch::engine::v1::DriverRideResponse* resp) {
  try {
    *resp = service_->StartTrip(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RideServer::CompleteRide(::grpc::ServerContext*, const dispatch::engine::v1::DriverRideRequest* req, dispatch::engine::v1::DriverRideResponse* resp) {
  try {
    *resp = service_->CompleteRide(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RideServer::Redispatch(::grpc::ServerContext*, const dispatch::engine::v1::RedispatchRequest* req, dispatch::engine::v1::RedispatchResponse* resp) {
  try {
    *resp = service_->Redispatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace dispatch::grpc
