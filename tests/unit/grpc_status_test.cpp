#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/driver_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/ride_server.hpp"
#include "internal/matching/batch_scheduler.hpp"
#include "internal/service/driver_service.hpp"
#include "internal/service/ride_service.hpp"
#include "internal/service/service_context.hpp"
#include "api/dispatch/engine/v1.hpp"

namespace {

using namespace dispatch::engine::v1;

dispatch::service::ServiceContext BuildServiceContext() {
  dispatch::runtime::config::RuntimeConfig config;
  config.mutable_dispatch()->set_worker_threads(1);
  dispatch::config::ConfigLoader::ApplyDefaults(config);
  return dispatch::factory::BuildContext(config, std::make_shared<dispatch::db::memory::MemoryRepository>());
}

std::string CreateRide(dispatch::grpc::RideServer& server, const std::string& customer_id) {
  CreateRideRequest req;
  req.set_customer_id(customer_id);
  req.mutable_pickup()->set_latitude(40.75);
  req.mutable_pickup()->set_longitude(-73.99);
  req.mutable_dropoff()->set_latitude(40.80);
  req.mutable_dropoff()->set_longitude(-73.95);
  CreateRideResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.CreateRide(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.ride_id().empty());
  return resp.ride_id();
}

void TestExceptionMapping() {
  using dispatch::grpc::ToStatus;
  assert(ToStatus(dispatch::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(dispatch::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(dispatch::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(dispatch::util::InvalidTransition("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(dispatch::util::StateConflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(dispatch::util::PermissionDenied("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(dispatch::util::NotFound("ride not found: r1")).error_message() == "ride not found: r1");
}

void TestCreateRideWithoutCustomerReturnsInvalidArgument() {
  auto                        ctx = BuildServiceContext();
  dispatch::grpc::RideServer server(std::make_shared<dispatch::service::RideService>(ctx));

  CreateRideRequest     req;
  CreateRideResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.CreateRide(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestUnknownRideReturnsNotFound() {
  auto                        ctx = BuildServiceContext();
  dispatch::grpc::RideServer server(std::make_shared<dispatch::service::RideService>(ctx));

  GetRideStatusRequest  req;
  req.set_ride_id("missing-ride");
  GetRideStatusResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetRideStatus(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestForeignCancelReturnsPermissionDenied() {
  auto ctx = BuildServiceContext();
  ctx.outbox->Start();
  dispatch::grpc::RideServer server(std::make_shared<dispatch::service::RideService>(ctx));
  const auto                 ride_id = CreateRide(server, "customer-1");

  CancelRideRequest     req;
  req.set_ride_id(ride_id);
  req.set_customer_id("customer-2");
  CancelRideResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.CancelRide(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  ctx.outbox->Stop();
}

void TestIllegalLifecycleStepReturnsFailedPrecondition() {
  auto ctx = BuildServiceContext();
  ctx.outbox->Start();
  dispatch::grpc::RideServer server(std::make_shared<dispatch::service::RideService>(ctx));
  const auto                 ride_id = CreateRide(server, "customer-1");

  // Still searching: redispatch is refused.
  RedispatchRequest     req;
  req.set_ride_id(ride_id);
  req.set_customer_id("customer-1");
  RedispatchResponse    resp;
  ::grpc::ServerContext grpc_ctx;
  assert(server.Redispatch(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  // Nobody is assigned yet, so no driver may report arrival.
  DriverRideRequest     arrive;
  arrive.set_ride_id(ride_id);
  arrive.set_driver_id("driver-1");
  DriverRideResponse    arrive_resp;
  ::grpc::ServerContext arrive_ctx;
  assert(server.MarkArrived(&arrive_ctx, &arrive, &arrive_resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  ctx.outbox->Stop();
}

void TestArbitrationOutcomesAreNotErrors() {
  auto                          ctx = BuildServiceContext();
  dispatch::grpc::DriverServer server(std::make_shared<dispatch::service::DriverService>(ctx));

  AcceptOfferRequest    req;
  req.set_offer_id("missing-offer");
  req.set_driver_id("driver-1");
  AcceptOfferResponse   resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.AcceptOffer(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.outcome() == ARBITRATION_OUTCOME_OFFER_NOT_FOUND);
}

void TestRejectUnknownOfferReturnsNotFound() {
  auto                          ctx = BuildServiceContext();
  dispatch::grpc::DriverServer server(std::make_shared<dispatch::service::DriverService>(ctx));

  RejectOfferRequest    req;
  req.set_offer_id("missing-offer");
  req.set_driver_id("driver-1");
  RejectOfferResponse   resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.RejectOffer(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestLocationUpdateSucceeds() {
  auto                          ctx = BuildServiceContext();
  dispatch::grpc::DriverServer server(std::make_shared<dispatch::service::DriverService>(ctx));

  UpdateLocationRequest  req;
  req.set_driver_id("driver-1");
  req.mutable_location()->set_latitude(40.75);
  req.mutable_location()->set_longitude(-73.99);
  UpdateLocationResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  assert(server.UpdateLocation(&grpc_ctx, &req, &resp).ok());
}

} // namespace

int main() {
  TestExceptionMapping();
  TestCreateRideWithoutCustomerReturnsInvalidArgument();
  TestUnknownRideReturnsNotFound();
  TestForeignCancelReturnsPermissionDenied();
  TestIllegalLifecycleStepReturnsFailedPrecondition();
  TestArbitrationOutcomesAreNotErrors();
  TestRejectUnknownOfferReturnsNotFound();
  TestLocationUpdateSucceeds();

  std::cout << "dispatch_unit_grpc_status: pass\n";
  return 0;
}
