#include "internal/realtime/connection_registry.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <tuple>
#include <vector>

#include "internal/events/events.hpp"
#include "internal/util/errors.hpp"

namespace {

using dispatch::engine::core::v1::USER_TYPE_CUSTOMER;
using dispatch::engine::core::v1::USER_TYPE_DRIVER;
using dispatch::realtime::ConnectionRegistry;
using dispatch::realtime::RealtimeEvent;
using dispatch::realtime::SendResult;

dispatch::realtime::EventSink Recorder(std::vector<std::string>& names, bool accept = true) {
  return [&names, accept](const RealtimeEvent& event) {
    names.push_back(event.name());
    return accept;
  };
}

void TestSendToUnknownUserIsNotConnected() {
  ConnectionRegistry registry;
  const auto         result = registry.Send("nobody", dispatch::events::RideRequestCancelled("ride-1", "ride_cancelled"));
  assert(result == SendResult::kNotConnected);
  assert(!registry.IsOnline("nobody"));
}

void TestSendFansOutToEveryConnection() {
  ConnectionRegistry       registry;
  std::vector<std::string> phone;
  std::vector<std::string> tablet;
  registry.Register("driver-1", "conn-a", USER_TYPE_DRIVER, Recorder(phone));
  registry.Register("driver-1", "conn-b", USER_TYPE_DRIVER, Recorder(tablet));

  const auto result = registry.Send("driver-1", dispatch::events::RideRequestCancelled("ride-1", "offer_expired"));
  assert(result == SendResult::kDelivered);
  assert(phone.size() == 1 && phone[0] == "ride:request:cancelled");
  assert(tablet.size() == 1);
  assert(registry.Connections("driver-1").size() == 2);
  assert(registry.OnlineUsers() == 1);
}

void TestRejectingSinkCountsAsUndelivered() {
  ConnectionRegistry       registry;
  std::vector<std::string> names;
  registry.Register("customer-1", "conn-a", USER_TYPE_CUSTOMER, Recorder(names, false));

  const auto result = registry.Send("customer-1", dispatch::events::NoDriversAvailable("ride-1", "no_candidates"));
  assert(result == SendResult::kNotConnected);
  assert(names.size() == 1);
}

void TestDuplicateConnectionIdIsRejected() {
  ConnectionRegistry       registry;
  std::vector<std::string> names;
  registry.Register("driver-1", "conn-a", USER_TYPE_DRIVER, Recorder(names));

  bool threw = false;
  try {
    registry.Register("driver-2", "conn-a", USER_TYPE_DRIVER, Recorder(names));
  } catch (const dispatch::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
  assert(!registry.IsOnline("driver-2"));
}

void TestPresenceFiresOnFirstConnectAndLastDisconnect() {
  ConnectionRegistry                                 registry;
  std::vector<std::tuple<std::string, int, bool>>    transitions;
  registry.SetPresenceListener([&](const std::string& user_id, dispatch::engine::core::v1::UserType type, bool online) {
    transitions.emplace_back(user_id, static_cast<int>(type), online);
  });

  std::vector<std::string> names;
  registry.Register("driver-1", "conn-a", USER_TYPE_DRIVER, Recorder(names));
  registry.Register("driver-1", "conn-b", USER_TYPE_DRIVER, Recorder(names));
  assert(transitions.size() == 1);
  assert(std::get<2>(transitions[0]));
  assert(std::get<1>(transitions[0]) == USER_TYPE_DRIVER);

  assert(registry.Unregister("conn-a"));
  assert(transitions.size() == 1);
  assert(registry.IsOnline("driver-1"));

  assert(registry.Unregister("conn-b"));
  assert(transitions.size() == 2);
  assert(!std::get<2>(transitions[1]));
  assert(!registry.IsOnline("driver-1"));

  assert(!registry.Unregister("conn-b"));
  assert(transitions.size() == 2);
}

void TestFailingPresenceListenerDoesNotBreakRegistration() {
  ConnectionRegistry registry;
  registry.SetPresenceListener([](const std::string&, dispatch::engine::core::v1::UserType, bool) {
    throw std::runtime_error("store unavailable");
  });

  std::vector<std::string> names;
  registry.Register("driver-1", "conn-a", USER_TYPE_DRIVER, Recorder(names));
  assert(registry.IsOnline("driver-1"));
  assert(registry.Unregister("conn-a"));
}

} // namespace

int main() {
  TestSendToUnknownUserIsNotConnected();
  TestSendFansOutToEveryConnection();
  TestRejectingSinkCountsAsUndelivered();
  TestDuplicateConnectionIdIsRejected();
  TestPresenceFiresOnFirstConnectAndLastDisconnect();
  TestFailingPresenceListenerDoesNotBreakRegistration();

  std::cout << "dispatch_unit_connection_registry: pass\n";
  return 0;
}
