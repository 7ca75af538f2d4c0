#include "internal/service/ride_service.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/matching/acceptance_arbitrator.hpp"
#include "internal/matching/batch_scheduler.hpp"
#include "internal/service/driver_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace dispatch::engine::v1;

struct Inbox {
  std::mutex                 mutex;
  std::vector<RealtimeEvent> events;

  dispatch::realtime::EventSink Sink() {
    return [this](const RealtimeEvent& event) {
      std::lock_guard lock(mutex);
      events.push_back(event);
      return true;
    };
  }
  std::vector<RealtimeEvent> Named(const std::string& name) {
    std::lock_guard            lock(mutex);
    std::vector<RealtimeEvent> out;
    for (const auto& event : events) {
      if (event.name() == name) out.push_back(event);
    }
    return out;
  }
};

bool WaitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return predicate();
}

struct Harness {
  dispatch::service::ServiceContext                  ctx;
  std::shared_ptr<dispatch::service::RideService>    rides;
  std::shared_ptr<dispatch::service::DriverService>  drivers;
  std::vector<std::unique_ptr<Inbox>>                inboxes;

  explicit Harness(uint64_t offer_window_ms = 30'000) {
    dispatch::runtime::config::RuntimeConfig config;
    config.mutable_dispatch()->set_offer_window_ms(offer_window_ms);
    config.mutable_dispatch()->set_batch_size(3);
    config.mutable_dispatch()->set_worker_threads(2);
    dispatch::config::ConfigLoader::ApplyDefaults(config);

    ctx = dispatch::factory::BuildContext(config, std::make_shared<dispatch::db::memory::MemoryRepository>());
    ctx.outbox->Start();
    ctx.scheduler->Start();
    rides   = std::make_shared<dispatch::service::RideService>(ctx);
    drivers = std::make_shared<dispatch::service::DriverService>(ctx);
  }

  ~Harness() {
    ctx.scheduler->Stop();
    ctx.outbox->Stop();
  }

  Inbox& Connect(const std::string& user_id, UserType type) {
    inboxes.push_back(std::make_unique<Inbox>());
    ctx.registry->Register(user_id, "conn-" + user_id, type, inboxes.back()->Sink());
    return *inboxes.back();
  }

  Inbox& OnlineDriver(const std::string& driver_id, double lat) {
    auto& inbox = Connect(driver_id, USER_TYPE_DRIVER);

    SetAvailabilityRequest online;
    online.set_driver_id(driver_id);
    online.set_online(true);
    online.set_rating(4.8);
    drivers->SetAvailability(online);

    UpdateLocationRequest location;
    location.set_driver_id(driver_id);
    location.mutable_location()->set_latitude(lat);
    location.mutable_location()->set_longitude(-73.99);
    drivers->UpdateLocation(location);
    return inbox;
  }

  CreateRideResponse Request(const std::string& customer_id = "customer-1") {
    CreateRideRequest req;
    req.set_customer_id(customer_id);
    req.mutable_pickup()->set_latitude(40.75);
    req.mutable_pickup()->set_longitude(-73.99);
    req.mutable_pickup()->set_address("Pickup St");
    req.mutable_dropoff()->set_latitude(40.80);
    req.mutable_dropoff()->set_longitude(-73.95);
    return rides->CreateRide(req);
  }

  std::vector<dispatch::db::model::OfferRecord> Offers(const std::string& ride_id) {
    auto tx     = ctx.repository->Begin();
    auto offers = ctx.repository->ListOffersForRide(*tx, ride_id);
    tx->Commit();
    return offers;
  }

  std::string OfferFor(const std::string& ride_id, const std::string& driver_id) {
    for (const auto& offer : Offers(ride_id)) {
      if (offer.driver_id == driver_id) return offer.id;
    }
    return "";
  }

  RideStatus Status(const std::string& ride_id) {
    GetRideStatusRequest req;
    req.set_ride_id(ride_id);
    return rides->GetRideStatus(req).ride().status();
  }

  dispatch::db::model::DriverAvailabilityRecord Driver(const std::string& driver_id) {
    auto tx     = ctx.repository->Begin();
    auto driver = ctx.repository->GetDriverAvailability(*tx, driver_id);
    tx->Commit();
    assert(driver.has_value());
    return *driver;
  }

  AcceptOfferResponse Accept(const std::string& ride_id, const std::string& driver_id) {
    AcceptOfferRequest req;
    req.set_offer_id(OfferFor(ride_id, driver_id));
    req.set_driver_id(driver_id);
    return drivers->AcceptOffer(req);
  }
};

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

DriverRideRequest DriverRide(const std::string& ride_id, const std::string& driver_id) {
  DriverRideRequest req;
  req.set_ride_id(ride_id);
  req.set_driver_id(driver_id);
  return req;
}

void TestCreateRideValidatesInput() {
  Harness h;

  CreateRideRequest missing_customer;
  missing_customer.mutable_pickup()->set_latitude(40.75);
  missing_customer.mutable_dropoff()->set_latitude(40.80);
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.rides->CreateRide(missing_customer); }));

  CreateRideRequest missing_dropoff;
  missing_dropoff.set_customer_id("customer-1");
  missing_dropoff.mutable_pickup()->set_latitude(40.75);
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.rides->CreateRide(missing_dropoff); }));

  CreateRideRequest bad_latitude;
  bad_latitude.set_customer_id("customer-1");
  bad_latitude.mutable_pickup()->set_latitude(91.0);
  bad_latitude.mutable_dropoff()->set_latitude(40.80);
  assert(Throws<dispatch::util::InvalidArgument>([&] { h.rides->CreateRide(bad_latitude); }));
}

void TestCreateRideStartsSearch() {
  Harness h;
  auto&   driver = h.OnlineDriver("driver-1", 40.751);

  const auto created = h.Request();
  assert(!created.ride_id().empty());
  assert(created.fare().amount() >= 5.0);
  assert(created.fare().currency() == "USD");

  GetRideStatusRequest status_req;
  status_req.set_ride_id(created.ride_id());
  const auto status = h.rides->GetRideStatus(status_req);
  assert(status.ride().status() == RIDE_STATUS_SEARCHING);
  assert(status.description() == "Looking for a driver");
  assert(status.ride().pickup().address() == "Pickup St");
  assert(status.ride().fare().amount() == created.fare().amount());

  assert(WaitUntil([&] { return h.Offers(created.ride_id()).size() == 1; }));
  h.ctx.outbox->Flush();
  const auto offers = driver.Named("ride:request:new");
  assert(offers.size() == 1);
  assert(offers[0].ride_request_new().ride_id() == created.ride_id());
  assert(offers[0].ride_request_new().fare().amount() == created.fare().amount());
  assert(offers[0].ride_request_new().has_expires_at());

  GetRideStatusRequest unknown;
  unknown.set_ride_id("missing");
  assert(Throws<dispatch::util::NotFound>([&] { h.rides->GetRideStatus(unknown); }));
}

void TestTripLifecycle() {
  Harness h;
  h.OnlineDriver("driver-1", 40.751);
  h.OnlineDriver("driver-2", 40.752);
  auto& customer = h.Connect("customer-1", USER_TYPE_CUSTOMER);

  const auto ride_id = h.Request().ride_id();
  assert(WaitUntil([&] { return h.Offers(ride_id).size() == 2; }));

  const auto accepted = h.Accept(ride_id, "driver-1");
  assert(accepted.outcome() == ARBITRATION_OUTCOME_WON);
  assert(accepted.ride_id() == ride_id);
  assert(h.Status(ride_id) == RIDE_STATUS_ASSIGNED);
  assert(!h.Driver("driver-1").is_available);

  // Only the assigned driver may advance the trip, and only in order.
  assert(Throws<dispatch::util::PermissionDenied>([&] { h.rides->MarkArrived(DriverRide(ride_id, "driver-2")); }));
  assert(Throws<dispatch::util::InvalidTransition>([&] { h.rides->StartTrip(DriverRide(ride_id, "driver-1")); }));

  assert(h.rides->MarkArrived(DriverRide(ride_id, "driver-1")).ride().status() == RIDE_STATUS_ARRIVED);
  assert(h.rides->StartTrip(DriverRide(ride_id, "driver-1")).ride().status() == RIDE_STATUS_IN_PROGRESS);
  const auto done = h.rides->CompleteRide(DriverRide(ride_id, "driver-1"));
  assert(done.ride().status() == RIDE_STATUS_COMPLETED);
  assert(done.ride().has_completed_at());

  const auto driver = h.Driver("driver-1");
  assert(driver.is_available);
  assert(driver.completed_rides == 1);

  GetOfferHistoryRequest history_req;
  history_req.set_ride_id(ride_id);
  const auto history = h.rides->GetOfferHistory(history_req);
  assert(history.offers_size() == 2);
  assert(history.history_size() == 5);
  assert(history.history(0).to_status() == RIDE_STATUS_SEARCHING);
  assert(history.history(1).to_status() == RIDE_STATUS_ASSIGNED);
  assert(history.history(4).to_status() == RIDE_STATUS_COMPLETED);
  assert(history.stats().drivers_contacted() == 2);
  assert(history.stats().batches_used() == 1);
  assert(history.stats().accepted() == 1);
  assert(history.stats().superseded() == 1);

  h.ctx.outbox->Flush();
  assert(customer.Named("ride:driver:assigned").size() == 1);
  const auto updates = customer.Named("ride:status:updated");
  assert(updates.size() == 3);
  assert(updates[2].ride_status_updated().status() == RIDE_STATUS_COMPLETED);

  assert(Throws<dispatch::util::InvalidTransition>([&] {
    CancelRideRequest cancel;
    cancel.set_ride_id(ride_id);
    cancel.set_customer_id("customer-1");
    h.rides->CancelRide(cancel);
  }));
}

void TestCancelWhileSearching() {
  Harness h;
  auto&   driver = h.OnlineDriver("driver-1", 40.751);

  const auto ride_id = h.Request().ride_id();
  assert(WaitUntil([&] { return h.Offers(ride_id).size() == 1; }));

  CancelRideRequest cancel;
  cancel.set_ride_id(ride_id);
  cancel.set_customer_id("customer-2");
  assert(Throws<dispatch::util::PermissionDenied>([&] { h.rides->CancelRide(cancel); }));

  cancel.set_customer_id("customer-1");
  const auto cancelled = h.rides->CancelRide(cancel);
  assert(cancelled.ride().status() == RIDE_STATUS_CANCELLED);
  assert(cancelled.ride().cancellation_reason() == "customer_cancelled");
  assert(!h.ctx.scheduler->IsActive(ride_id));
  for (const auto& offer : h.Offers(ride_id)) assert(offer.status == OFFER_STATUS_EXPIRED);

  const auto late = h.Accept(ride_id, "driver-1");
  assert(late.outcome() != ARBITRATION_OUTCOME_WON);
  assert(h.Status(ride_id) == RIDE_STATUS_CANCELLED);

  h.ctx.outbox->Flush();
  const auto notices = driver.Named("ride:request:cancelled");
  assert(notices.size() == 1);
  assert(notices[0].ride_request_cancelled().reason() == "ride_cancelled");

  assert(Throws<dispatch::util::InvalidTransition>([&] { h.rides->CancelRide(cancel); }));
}

void TestCancelAfterAssignmentReleasesDriver() {
  Harness h;
  auto&   driver = h.OnlineDriver("driver-1", 40.751);

  const auto ride_id = h.Request().ride_id();
  assert(WaitUntil([&] { return h.Offers(ride_id).size() == 1; }));
  assert(h.Accept(ride_id, "driver-1").outcome() == ARBITRATION_OUTCOME_WON);

  CancelRideRequest cancel;
  cancel.set_ride_id(ride_id);
  cancel.set_customer_id("customer-1");
  cancel.set_reason("found_another_ride");
  const auto cancelled = h.rides->CancelRide(cancel);
  assert(cancelled.ride().cancellation_reason() == "found_another_ride");
  assert(cancelled.ride().assigned_driver_id().empty());
  assert(h.Driver("driver-1").is_available);

  h.ctx.outbox->Flush();
  assert(driver.Named("ride:request:cancelled").size() == 1);
}

void TestCancelRacingAcceptAlwaysEndsCancelled() {
  for (int round = 0; round < 10; ++round) {
    Harness h;
    h.OnlineDriver("driver-1", 40.751);

    const auto ride_id = h.Request().ride_id();
    assert(WaitUntil([&] { return h.Offers(ride_id).size() == 1; }));

    const auto offer_id = h.OfferFor(ride_id, "driver-1");
    AcceptOfferResponse accepted;
    std::thread accepter([&] { accepted = h.Accept(ride_id, "driver-1"); });
    std::thread canceller([&] {
      CancelRideRequest cancel;
      cancel.set_ride_id(ride_id);
      cancel.set_customer_id("customer-1");
      h.rides->CancelRide(cancel);
    });
    accepter.join();
    canceller.join();

    assert(h.Status(ride_id) == RIDE_STATUS_CANCELLED);
    assert(h.Driver("driver-1").is_available);
    assert(!h.ctx.scheduler->IsActive(ride_id));

    GetOfferHistoryRequest history_req;
    history_req.set_ride_id(ride_id);
    const auto history = h.rides->GetOfferHistory(history_req);
    assert(history.offers_size() == 1);
    assert(history.offers(0).id() == offer_id);
    assert(history.history(0).to_status() == RIDE_STATUS_SEARCHING);
    assert(history.history(history.history_size() - 1).to_status() == RIDE_STATUS_CANCELLED);

    // Either the accept committed first and the cancel released the driver,
    // or the cancel committed first and expired the offer.
    if (accepted.outcome() == ARBITRATION_OUTCOME_WON) {
      assert(history.history_size() == 3);
      assert(history.history(1).from_status() == RIDE_STATUS_SEARCHING);
      assert(history.history(1).to_status() == RIDE_STATUS_ASSIGNED);
      assert(history.offers(0).status() == OFFER_STATUS_ACCEPTED);
    } else {
      assert(history.history_size() == 2);
      assert(history.offers(0).status() == OFFER_STATUS_EXPIRED);
    }
  }
}

void TestCancelDuringBroadcastLeavesNoPendingOffers() {
  for (int round = 0; round < 10; ++round) {
    Harness h;
    h.OnlineDriver("driver-1", 40.751);
    h.OnlineDriver("driver-2", 40.752);

    // The first batch is being selected while the customer cancels.
    const auto ride_id = h.Request().ride_id();
    CancelRideRequest cancel;
    cancel.set_ride_id(ride_id);
    cancel.set_customer_id("customer-1");
    h.rides->CancelRide(cancel);

    assert(WaitUntil([&] { return !h.ctx.scheduler->IsActive(ride_id); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    assert(h.Status(ride_id) == RIDE_STATUS_CANCELLED);
    for (const auto& offer : h.Offers(ride_id)) {
      assert(offer.status == OFFER_STATUS_EXPIRED);
    }
  }
}

void TestRedispatchAfterNoDrivers() {
  Harness h;
  const auto created = h.Request();
  assert(WaitUntil([&] { return h.Status(created.ride_id()) == RIDE_STATUS_NO_DRIVERS_AVAILABLE; }));

  RedispatchRequest req;
  req.set_ride_id(created.ride_id());
  req.set_customer_id("customer-2");
  assert(Throws<dispatch::util::PermissionDenied>([&] { h.rides->Redispatch(req); }));

  h.OnlineDriver("driver-1", 40.751);
  req.set_customer_id("customer-1");
  const auto again = h.rides->Redispatch(req);
  assert(!again.ride_id().empty());
  assert(again.ride_id() != created.ride_id());
  assert(h.Status(created.ride_id()) == RIDE_STATUS_NO_DRIVERS_AVAILABLE);

  GetRideStatusRequest status_req;
  status_req.set_ride_id(again.ride_id());
  const auto status = h.rides->GetRideStatus(status_req);
  assert(status.ride().fare().amount() == created.fare().amount());
  assert(status.ride().pickup().address() == "Pickup St");

  assert(WaitUntil([&] { return h.Offers(again.ride_id()).size() == 1; }));

  GetOfferHistoryRequest history_req;
  history_req.set_ride_id(again.ride_id());
  const auto history = h.rides->GetOfferHistory(history_req);
  assert(history.history(0).reason() == "redispatch_of:" + created.ride_id());

  // A ride that is still searching cannot be redispatched.
  RedispatchRequest live;
  live.set_ride_id(again.ride_id());
  live.set_customer_id("customer-1");
  assert(Throws<dispatch::util::InvalidTransition>([&] { h.rides->Redispatch(live); }));
}

} // namespace

int main() {
  TestCreateRideValidatesInput();
  TestCreateRideStartsSearch();
  TestTripLifecycle();
  TestCancelWhileSearching();
  TestCancelAfterAssignmentReleasesDriver();
  TestCancelRacingAcceptAlwaysEndsCancelled();
  TestCancelDuringBroadcastLeavesNoPendingOffers();
  TestRedispatchAfterNoDrivers();

  std::cout << "dispatch_unit_ride_service: pass\n";
  return 0;
}
