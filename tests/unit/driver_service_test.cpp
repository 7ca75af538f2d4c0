#include "internal/service/driver_service.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/matching/batch_scheduler.hpp"
#include "internal/service/realtime_service.hpp"
#include "internal/service/ride_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace dispatch::engine::v1;

bool WaitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return predicate();
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

struct Harness {
  dispatch::service::ServiceContext                   ctx;
  std::shared_ptr<dispatch::service::RideService>     rides;
  std::shared_ptr<dispatch::service::DriverService>   drivers;
  std::shared_ptr<dispatch::service::RealtimeService> realtime;

  Harness() {
    dispatch::runtime::config::RuntimeConfig config;
    config.mutable_dispatch()->set_worker_threads(1);
    dispatch::config::ConfigLoader::ApplyDefaults(config);

    ctx = dispatch::factory::BuildContext(config, std::make_shared<dispatch::db::memory::MemoryRepository>());
    ctx.outbox->Start();
    ctx.scheduler->Start();
    rides    = std::make_shared<dispatch::service::RideService>(ctx);
    drivers  = std::make_shared<dispatch::service::DriverService>(ctx);
    realtime = std::make_shared<dispatch::service::RealtimeService>(ctx);
  }

  ~Harness() {
    ctx.scheduler->Stop();
    ctx.outbox->Stop();
  }

  std::optional<dispatch::db::model::DriverAvailabilityRecord> Driver(const std::string& driver_id) {
    auto tx     = ctx.repository->Begin();
    auto driver = ctx.repository->GetDriverAvailability(*tx, driver_id);
    tx->Commit();
    return driver;
  }

  void Locate(const std::string& driver_id, double lat, double lon) {
    UpdateLocationRequest req;
    req.set_driver_id(driver_id);
    req.mutable_location()->set_latitude(lat);
    req.mutable_location()->set_longitude(lon);
    drivers->UpdateLocation(req);
  }

  SetAvailabilityResponse SetOnline(const std::string& driver_id, bool online) {
    SetAvailabilityRequest req;
    req.set_driver_id(driver_id);
    req.set_online(online);
    return drivers->SetAvailability(req);
  }

  std::shared_ptr<dispatch::service::RealtimeSession> ConnectDriver(const std::string& driver_id) {
    ConnectRequest req;
    req.set_user_id(driver_id);
    req.set_user_type(USER_TYPE_DRIVER);
    return realtime->Connect(req);
  }

  std::string RequestRide() {
    CreateRideRequest req;
    req.set_customer_id("customer-1");
    req.mutable_pickup()->set_latitude(40.75);
    req.mutable_pickup()->set_longitude(-73.99);
    req.mutable_dropoff()->set_latitude(40.80);
    req.mutable_dropoff()->set_longitude(-73.95);
    return rides->CreateRide(req).ride_id();
  }

  ListPendingOffersResponse Pending(const std::string& driver_id) {
    ListPendingOffersRequest req;
    req.set_driver_id(driver_id);
    return drivers->ListPendingOffers(req);
  }
};

void TestUpdateLocationCreatesAndMovesDriver() {
  Harness h;
  h.Locate("driver-1", 40.75, -73.99);

  auto driver = h.Driver("driver-1");
  assert(driver.has_value());
  assert(driver->has_location);
  assert(driver->is_available);
  assert(!driver->is_online);
  assert(driver->last_seen_at_ms > 0);

  h.Locate("driver-1", 40.76, -73.98);
  driver = h.Driver("driver-1");
  assert(driver->latitude == 40.76);
  assert(driver->longitude == -73.98);
}

void TestUpdateLocationRejectsBadInput() {
  Harness h;

  UpdateLocationRequest missing_location;
  missing_location.set_driver_id("driver-1");
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.drivers->UpdateLocation(missing_location); }));

  UpdateLocationRequest out_of_range;
  out_of_range.set_driver_id("driver-1");
  out_of_range.mutable_location()->set_latitude(10);
  out_of_range.mutable_location()->set_longitude(181);
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.drivers->UpdateLocation(out_of_range); }));

  UpdateLocationRequest anonymous;
  anonymous.mutable_location()->set_latitude(10);
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.drivers->UpdateLocation(anonymous); }));
  assert(!h.Driver("driver-1").has_value());
}

void TestSetAvailabilityMergesProfile() {
  Harness h;

  SetAvailabilityRequest req;
  req.set_driver_id("driver-1");
  req.set_online(true);
  req.mutable_variant()->set_vehicle_type("sedan");
  req.mutable_variant()->set_service_tier("premium");
  req.set_rating(4.9);
  req.set_completed_rides(120);
  const auto resp = h.drivers->SetAvailability(req);
  assert(resp.online());
  assert(resp.available());

  auto driver = h.Driver("driver-1");
  assert(driver->vehicle_type == "sedan");
  assert(driver->service_tier == "premium");
  assert(driver->rating == 4.9);
  assert(driver->completed_rides == 120);
  assert(driver->available_since_ms > 0);

  const auto offline = h.SetOnline("driver-1", false);
  assert(!offline.online());
  assert(!offline.available());
  driver = h.Driver("driver-1");
  assert(driver->available_since_ms == 0);
  // The profile survives an availability toggle.
  assert(driver->vehicle_type == "sedan");
}

void TestOfflineRefusedDuringActiveRide() {
  Harness h;
  auto    session = h.ConnectDriver("driver-1");
  h.SetOnline("driver-1", true);
  h.Locate("driver-1", 40.751, -73.99);

  const auto ride_id = h.RequestRide();
  assert(WaitUntil([&] { return h.Pending("driver-1").offers_size() == 1; }));

  AcceptOfferRequest accept;
  accept.set_offer_id(h.Pending("driver-1").offers(0).id());
  accept.set_driver_id("driver-1");
  assert(h.drivers->AcceptOffer(accept).outcome() == ARBITRATION_OUTCOME_WON);
  assert(h.Pending("driver-1").offers_size() == 0);

  assert(Throws<dispatch::util::InvalidTransition>([&] { h.SetOnline("driver-1", false); }));
  assert(h.Driver("driver-1")->is_online);

  // Staying online mid-ride keeps the driver out of dispatch.
  const auto still_online = h.SetOnline("driver-1", true);
  assert(still_online.online());
  assert(!still_online.available());
  (void)ride_id;
}

void TestRejectOffer() {
  Harness h;
  auto    session = h.ConnectDriver("driver-1");
  h.SetOnline("driver-1", true);
  h.Locate("driver-1", 40.751, -73.99);

  h.RequestRide();
  assert(WaitUntil([&] { return h.Pending("driver-1").offers_size() == 1; }));
  const auto offer_id = h.Pending("driver-1").offers(0).id();

  RejectOfferRequest reject;
  reject.set_offer_id(offer_id);
  reject.set_driver_id("driver-1");
  reject.set_reason("too_far");
  auto resp = h.drivers->RejectOffer(reject);
  assert(resp.recorded());
  assert(resp.message() == "offer rejected");
  assert(h.Pending("driver-1").offers_size() == 0);

  resp = h.drivers->RejectOffer(reject);
  assert(!resp.recorded());
  assert(resp.message() == "offer is no longer pending");

  reject.set_driver_id("driver-2");
  assert(Throws<dispatch::util::PermissionDenied>([&] { h.drivers->RejectOffer(reject); }));

  RejectOfferRequest missing;
  missing.set_driver_id("driver-1");
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.drivers->RejectOffer(missing); }));
}

void TestConnectMirrorsPresence() {
  Harness h;

  auto session = h.ConnectDriver("driver-1");
  auto driver  = h.Driver("driver-1");
  assert(driver.has_value());
  assert(driver->is_online);
  assert(!driver->has_location);

  session->Close();
  assert(session->Closed());
  assert(!h.Driver("driver-1")->is_online);
  session->Close();

  // A customer connection never creates a driver row.
  ConnectRequest customer;
  customer.set_user_id("customer-1");
  customer.set_user_type(USER_TYPE_CUSTOMER);
  auto customer_session = h.realtime->Connect(customer);
  assert(h.ctx.registry->IsOnline("customer-1"));
  assert(!h.Driver("customer-1").has_value());

  ConnectRequest untyped;
  untyped.set_user_id("someone");
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.realtime->Connect(untyped); }));
}

void TestSessionReceivesOffers() {
  Harness h;
  auto    session = h.ConnectDriver("driver-1");
  h.Locate("driver-1", 40.751, -73.99);

  const auto ride_id = h.RequestRide();
  const auto event   = session->Next(std::chrono::seconds(5));
  assert(event.has_value());
  assert(event->name() == "ride:request:new");
  assert(event->ride_request_new().ride_id() == ride_id);
  assert(event->ride_request_new().batch_number() == 1);

  assert(!session->Next(std::chrono::milliseconds(20)).has_value());
}

void TestSessionQueueIsBounded() {
  auto registry = std::make_shared<dispatch::realtime::ConnectionRegistry>();
  dispatch::service::RealtimeSession session(registry, "driver-1", "conn-1");

  RealtimeEvent event;
  event.set_name("ride:request:cancelled");
  for (std::size_t i = 0; i < dispatch::service::RealtimeSession::kMaxQueuedEvents; ++i) {
    assert(session.Push(event));
  }
  assert(!session.Push(event));

  session.Close();
  assert(!session.Push(event));
  // Queued events still drain after close.
  assert(session.Next(std::chrono::milliseconds(1)).has_value());
}

} // namespace

int main() {
  TestUpdateLocationCreatesAndMovesDriver();
  TestUpdateLocationRejectsBadInput();
  TestSetAvailabilityMergesProfile();
  TestOfflineRefusedDuringActiveRide();
  TestRejectOffer();
  TestConnectMirrorsPresence();
  TestSessionReceivesOffers();
  TestSessionQueueIsBounded();

  std::cout << "dispatch_unit_driver_service: pass\n";
  return 0;
}
