#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "dispatch/engine/core/v1/types.pb.h"
#include "dispatch/engine/realtime/v1/events.pb.h"

namespace dispatch::realtime {

using dispatch::engine::core::v1::UserType;
using dispatch::engine::realtime::v1::RealtimeEvent;

// Pushes one event onto one live connection. Returns false once the
// connection can no longer accept events.
using EventSink = std::function<bool(const RealtimeEvent&)>;

enum class SendResult {
  kDelivered,
  kNotConnected,
};

struct ConnectionInfo {
  std::string user_id;
  UserType    user_type = dispatch::engine::core::v1::USER_TYPE_UNSPECIFIED;
  std::string connection_id;
  uint64_t    connected_at_ms = 0;
};

/*
  ConnectionRegistry

  In-memory map of live real-time connections, keyed by user_id.

  - A user may hold several connections; Send() fans out to all of them
    in registration order.
  - Sending to a user with no connection is a normal outcome
    (kNotConnected), not an error.
  - The presence listener fires on a user's first connect and last
    disconnect, serialized so listeners observe transitions in order.

  The registry is a rebuildable cache. Nothing here is durable.
*/
class ConnectionRegistry {
 public:
  using PresenceListener = std::function<void(const std::string& user_id, UserType user_type, bool online)>;

  void SetPresenceListener(PresenceListener listener);

  // Throws util::AlreadyExists if connection_id is already registered.
  void Register(const std::string& user_id, const std::string& connection_id, UserType user_type, EventSink sink);

  // Returns false if the connection was not registered.
  bool Unregister(const std::string& connection_id);

  bool IsOnline(const std::string& user_id) const;

  SendResult Send(const std::string& user_id, const RealtimeEvent& event);

  std::vector<ConnectionInfo> Connections(const std::string& user_id) const;
  std::size_t                 OnlineUsers() const;

 private:
  struct Connection {
    ConnectionInfo info;
    EventSink      sink;
  };

  void NotifyPresence(const std::string& user_id, UserType user_type, bool online);

  mutable std::mutex                                                        mutex_;
  std::unordered_map<std::string, std::vector<std::shared_ptr<Connection>>> by_user_;
  std::unordered_map<std::string, std::string>                              user_by_connection_;

  // Held across a membership change and its listener call.
  std::mutex       presence_mutex_;
  PresenceListener presence_listener_;
};

} // namespace dispatch::realtime
