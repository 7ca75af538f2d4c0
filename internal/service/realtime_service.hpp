#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "api/dispatch/engine/v1.hpp"
#include "internal/realtime/connection_registry.hpp"
#include "service_context.hpp"

namespace dispatch::service {

/*
  One live client connection.

  The registry pushes events into a bounded queue; the transport drains it
  with Next(). Close() unregisters the connection and wakes the reader.
*/
class RealtimeSession {
 public:
  static constexpr std::size_t kMaxQueuedEvents = 1024;

  RealtimeSession(std::shared_ptr<dispatch::realtime::ConnectionRegistry> registry, std::string user_id, std::string connection_id);
  ~RealtimeSession();

  RealtimeSession(const RealtimeSession&)            = delete;
  RealtimeSession& operator=(const RealtimeSession&) = delete;

  const std::string& UserId() const {
    return user_id_;
  }
  const std::string& ConnectionId() const {
    return connection_id_;
  }

  // Returns false when closed or when the reader has fallen too far behind.
  bool Push(const dispatch::engine::v1::RealtimeEvent& event);

  // nullopt on timeout or once closed and drained.
  std::optional<dispatch::engine::v1::RealtimeEvent> Next(std::chrono::milliseconds timeout);

  bool Closed() const;
  void Close();

 private:
  std::shared_ptr<dispatch::realtime::ConnectionRegistry> registry_;
  std::string                                             user_id_;
  std::string                                             connection_id_;

  mutable std::mutex                               mutex_;
  std::condition_variable                          cv_;
  std::deque<dispatch::engine::v1::RealtimeEvent> queue_;
  bool                                             closed_ = false;
};

class RealtimeService {
 public:
  // Installs the presence listener that mirrors driver connects/disconnects into storage.
  explicit RealtimeService(ServiceContext ctx);

  std::shared_ptr<RealtimeSession> Connect(const dispatch::engine::v1::ConnectRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace dispatch::service
