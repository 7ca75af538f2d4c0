#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "api/dispatch/engine/v1.hpp"

using namespace dispatch::engine::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  dispatchctl <addr> request <customer_id> <pickup_lat> <pickup_lon> <dropoff_lat> <dropoff_lon> [vehicle_type] [service_tier]\n"
            << "  dispatchctl <addr> cancel <ride_id> <customer_id> [reason]\n"
            << "  dispatchctl <addr> status <ride_id>\n"
            << "  dispatchctl <addr> history <ride_id>\n"
            << "  dispatchctl <addr> redispatch <ride_id> <customer_id>\n"
            << "  dispatchctl <addr> arrive|start|complete <ride_id> <driver_id>\n"
            << "  dispatchctl <addr> accept <offer_id> <driver_id>\n"
            << "  dispatchctl <addr> reject <offer_id> <driver_id> [reason]\n"
            << "  dispatchctl <addr> location <driver_id> <lat> <lon>\n"
            << "  dispatchctl <addr> online <driver_id> [vehicle_type] [service_tier]\n"
            << "  dispatchctl <addr> offline <driver_id>\n"
            << "  dispatchctl <addr> offers <driver_id>\n"
            << "  dispatchctl <addr> listen <user_id> <driver|customer>\n";
}

static std::optional<double> ParseDouble(const char* value) {
  char*        end    = nullptr;
  const double parsed = std::strtod(value, &end);
  if (end == value || *end != '\0') return std::nullopt;
  return parsed;
}

static bool ParsePoint(const char* lat, const char* lon, GeoPoint* out) {
  auto latitude  = ParseDouble(lat);
  auto longitude = ParseDouble(lon);
  if (!latitude || !longitude) {
    std::cerr << "invalid coordinates: " << lat << "," << lon << "\n";
    return false;
  }
  out->set_latitude(*latitude);
  out->set_longitude(*longitude);
  return true;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

static const char* StatusName(RideStatus status) {
  switch (status) {
    case RIDE_STATUS_SEARCHING:
      return "searching";
    case RIDE_STATUS_ASSIGNED:
      return "assigned";
    case RIDE_STATUS_ARRIVED:
      return "arrived";
    case RIDE_STATUS_IN_PROGRESS:
      return "in_progress";
    case RIDE_STATUS_COMPLETED:
      return "completed";
    case RIDE_STATUS_CANCELLED:
      return "cancelled";
    case RIDE_STATUS_NO_DRIVERS_AVAILABLE:
      return "no_drivers_available";
    default:
      return "unspecified";
  }
}

static void PrintRide(const Ride& ride) {
  std::cout << "ride=" << ride.id() << "\n";
  std::cout << "status=" << StatusName(ride.status()) << "\n";
  if (!ride.assigned_driver_id().empty()) std::cout << "driver=" << ride.assigned_driver_id() << "\n";
  std::cout << "fare=" << ride.fare().amount() << " " << ride.fare().currency() << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto ride_stub     = RideService::NewStub(channel);
  auto driver_stub   = DriverService::NewStub(channel);
  auto realtime_stub = RealtimeService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "request") {
    if (argc < 8) {
      Usage();
      return 1;
    }

    CreateRideRequest req;
    req.set_customer_id(argv[3]);
    if (!ParsePoint(argv[4], argv[5], req.mutable_pickup())) return 1;
    if (!ParsePoint(argv[6], argv[7], req.mutable_dropoff())) return 1;
    if (argc >= 9) req.mutable_variant()->set_vehicle_type(argv[8]);
    if (argc >= 10) req.mutable_variant()->set_service_tier(argv[9]);

    CreateRideResponse resp;
    auto               status = ride_stub->CreateRide(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "ride=" << resp.ride_id() << "\n";
    std::cout << "fare=" << resp.fare().amount() << " " << resp.fare().currency() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    CancelRideRequest req;
    req.set_ride_id(argv[3]);
    req.set_customer_id(argv[4]);
    if (argc >= 6) req.set_reason(argv[5]);

    CancelRideResponse resp;
    auto               status = ride_stub->CancelRide(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintRide(resp.ride());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetRideStatusRequest req;
    req.set_ride_id(argv[3]);

    GetRideStatusResponse resp;
    auto                  status = ride_stub->GetRideStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintRide(resp.ride());
    std::cout << "description=" << resp.description() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetOfferHistoryRequest req;
    req.set_ride_id(argv[3]);

    GetOfferHistoryResponse resp;
    auto                    status = ride_stub->GetOfferHistory(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& offer : resp.offers()) {
      std::cout << "offer=" << offer.id() << " batch=" << offer.batch_number() << " driver=" << offer.driver_id() << " status=" << offer.status()
                << " distance_km=" << offer.distance_km() << "\n";
    }
    for (const auto& change : resp.history()) {
      std::cout << "history#" << change.sequence() << " " << StatusName(change.from_status()) << " -> " << StatusName(change.to_status())
                << " actor=" << change.actor() << " reason=" << change.reason() << "\n";
    }
    const auto& stats = resp.stats();
    std::cout << "drivers_contacted=" << stats.drivers_contacted() << " batches=" << stats.batches_used() << " accepted=" << stats.accepted()
              << " rejected=" << stats.rejected() << " expired=" << stats.expired() << " superseded=" << stats.superseded() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "redispatch") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    RedispatchRequest req;
    req.set_ride_id(argv[3]);
    req.set_customer_id(argv[4]);

    RedispatchResponse resp;
    auto               status = ride_stub->Redispatch(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "ride=" << resp.ride_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "arrive" || cmd == "start" || cmd == "complete") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    DriverRideRequest req;
    req.set_ride_id(argv[3]);
    req.set_driver_id(argv[4]);

    DriverRideResponse resp;
    grpc::Status       status;
    if (cmd == "arrive") {
      status = ride_stub->MarkArrived(&ctx, req, &resp);
    } else if (cmd == "start") {
      status = ride_stub->StartTrip(&ctx, req, &resp);
    } else {
      status = ride_stub->CompleteRide(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    PrintRide(resp.ride());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "accept") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    AcceptOfferRequest req;
    req.set_offer_id(argv[3]);
    req.set_driver_id(argv[4]);

    AcceptOfferResponse resp;
    auto                status = driver_stub->AcceptOffer(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "outcome=" << ArbitrationOutcome_Name(resp.outcome()) << "\n";
    std::cout << "ride=" << resp.ride_id() << "\n";
    if (!resp.message().empty()) std::cout << "message=" << resp.message() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reject") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    RejectOfferRequest req;
    req.set_offer_id(argv[3]);
    req.set_driver_id(argv[4]);
    if (argc >= 6) req.set_reason(argv[5]);

    RejectOfferResponse resp;
    auto                status = driver_stub->RejectOffer(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "recorded=" << (resp.recorded() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "location") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    UpdateLocationRequest req;
    req.set_driver_id(argv[3]);
    if (!ParsePoint(argv[4], argv[5], req.mutable_location())) return 1;

    UpdateLocationResponse resp;
    auto                   status = driver_stub->UpdateLocation(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "updated\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "online" || cmd == "offline") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    SetAvailabilityRequest req;
    req.set_driver_id(argv[3]);
    req.set_online(cmd == "online");
    if (argc >= 5) req.mutable_variant()->set_vehicle_type(argv[4]);
    if (argc >= 6) req.mutable_variant()->set_service_tier(argv[5]);

    SetAvailabilityResponse resp;
    auto                    status = driver_stub->SetAvailability(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "online=" << (resp.online() ? "true" : "false") << " available=" << (resp.available() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "offers") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    ListPendingOffersRequest req;
    req.set_driver_id(argv[3]);

    ListPendingOffersResponse resp;
    auto                      status = driver_stub->ListPendingOffers(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& offer : resp.offers()) {
      std::cout << "offer=" << offer.id() << " ride=" << offer.ride_id() << " batch=" << offer.batch_number() << " eta_minutes=" << offer.eta_minutes()
                << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "listen") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    ConnectRequest req;
    req.set_user_id(argv[3]);
    const std::string type = argv[4];
    if (type == "driver") {
      req.set_user_type(USER_TYPE_DRIVER);
    } else if (type == "customer") {
      req.set_user_type(USER_TYPE_CUSTOMER);
    } else {
      std::cerr << "unsupported user type: " << type << "\n";
      return 1;
    }

    auto          reader = realtime_stub->Connect(&ctx, req);
    RealtimeEvent event;
    while (reader->Read(&event)) {
      std::cout << event.name() << " " << event.ShortDebugString() << std::endl;
    }
    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  Usage();
  return 1;
}
