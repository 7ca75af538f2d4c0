#include "connection_registry.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace dispatch::realtime {

void ConnectionRegistry::SetPresenceListener(PresenceListener listener) {
  std::lock_guard presence_lock(presence_mutex_);
  presence_listener_ = std::move(listener);
}

void ConnectionRegistry::Register(const std::string& user_id, const std::string& connection_id, UserType user_type, EventSink sink) {
  std::lock_guard presence_lock(presence_mutex_);

  bool first_connection = false;
  {
    std::lock_guard lock(mutex_);
    if (user_by_connection_.contains(connection_id)) {
      throw util::AlreadyExists("register connection: connection " + connection_id + " is already registered");
    }

    auto connection  = std::make_shared<Connection>();
    connection->info = ConnectionInfo{user_id, user_type, connection_id, util::NowMillis()};
    connection->sink = std::move(sink);

    auto& connections = by_user_[user_id];
    first_connection  = connections.empty();
    connections.push_back(std::move(connection));
    user_by_connection_[connection_id] = user_id;
  }

  DISPATCH_LOG_INFO("Connection registered", {observability::StringField("user_id", user_id), observability::StringField("connection_id", connection_id),
                                              observability::IntField("user_type", user_type)});

  if (first_connection) NotifyPresence(user_id, user_type, true);
}

bool ConnectionRegistry::Unregister(const std::string& connection_id) {
  std::lock_guard presence_lock(presence_mutex_);

  std::string user_id;
  UserType    user_type       = dispatch::engine::core::v1::USER_TYPE_UNSPECIFIED;
  bool        last_connection = false;
  {
    std::lock_guard lock(mutex_);
    auto            owner = user_by_connection_.find(connection_id);
    if (owner == user_by_connection_.end()) return false;

    user_id = owner->second;
    user_by_connection_.erase(owner);

    auto& connections = by_user_[user_id];
    auto  it          = std::find_if(connections.begin(), connections.end(), [&](const auto& c) {
      return c->info.connection_id == connection_id;
    });
    if (it != connections.end()) {
      user_type = (*it)->info.user_type;
      connections.erase(it);
    }
    if (connections.empty()) {
      by_user_.erase(user_id);
      last_connection = true;
    }
  }

  DISPATCH_LOG_INFO("Connection closed", {observability::StringField("user_id", user_id), observability::StringField("connection_id", connection_id)});

  if (last_connection) NotifyPresence(user_id, user_type, false);
  return true;
}

bool ConnectionRegistry::IsOnline(const std::string& user_id) const {
  std::lock_guard lock(mutex_);
  return by_user_.contains(user_id);
}

SendResult ConnectionRegistry::Send(const std::string& user_id, const RealtimeEvent& event) {
  std::vector<std::shared_ptr<Connection>> targets;
  {
    std::lock_guard lock(mutex_);
    auto            it = by_user_.find(user_id);
    if (it == by_user_.end()) return SendResult::kNotConnected;
    targets = it->second;
  }

  bool delivered = false;
  for (const auto& connection : targets) {
    if (connection->sink(event)) {
      delivered = true;
    } else {
      DISPATCH_LOG_WARN("Connection rejected event",
                        {observability::StringField("connection_id", connection->info.connection_id), observability::StringField("event", event.name())});
    }
  }
  return delivered ? SendResult::kDelivered : SendResult::kNotConnected;
}

std::vector<ConnectionInfo> ConnectionRegistry::Connections(const std::string& user_id) const {
  std::lock_guard             lock(mutex_);
  std::vector<ConnectionInfo> out;
  auto                        it = by_user_.find(user_id);
  if (it == by_user_.end()) return out;
  for (const auto& connection : it->second) out.push_back(connection->info);
  return out;
}

std::size_t ConnectionRegistry::OnlineUsers() const {
  std::lock_guard lock(mutex_);
  return by_user_.size();
}

void ConnectionRegistry::NotifyPresence(const std::string& user_id, UserType user_type, bool online) {
  if (!presence_listener_) return;
  try {
    presence_listener_(user_id, user_type, online);
  } catch (const std::exception& e) {
    DISPATCH_LOG_ERROR("Presence listener failed", {observability::StringField("user_id", user_id), observability::BoolField("online", online),
                                                    observability::StringField("error", e.what())});
  }
}

} // namespace dispatch::realtime
