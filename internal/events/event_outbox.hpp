#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/events/events.hpp"
#include "internal/realtime/connection_registry.hpp"

namespace dispatch::events {

struct Notification {
  std::string   user_id;
  RealtimeEvent event;
};

/*
  EventOutbox

  Notifications are published only after the transaction that produced
  them has committed. A single worker delivers them through the
  ConnectionRegistry in publish order. Undeliverable notifications are
  logged and dropped.
*/
class EventOutbox {
 public:
  explicit EventOutbox(std::shared_ptr<realtime::ConnectionRegistry> registry);
  ~EventOutbox();

  EventOutbox(const EventOutbox&)            = delete;
  EventOutbox& operator=(const EventOutbox&) = delete;

  void Start();
  // Delivers what is already queued, then joins the worker.
  void Stop();

  // After Stop() notifications are counted as dropped instead of queued.
  void Publish(std::string user_id, RealtimeEvent event);
  void Publish(std::vector<Notification> notifications);

  // Blocks until everything published before the call has been handed to the registry.
  void Flush();

  uint64_t Delivered() const {
    return delivered_.load();
  }
  uint64_t Dropped() const {
    return dropped_.load();
  }

 private:
  void Run();
  void Deliver(const Notification& notification);

  std::shared_ptr<realtime::ConnectionRegistry> registry_;

  std::mutex               mutex_;
  std::condition_variable  cv_;
  std::condition_variable  drained_cv_;
  std::deque<Notification> queue_;
  bool                     busy_     = false;
  bool                     stopping_ = false;
  std::thread              thread_;

  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> dropped_{0};
};

} // namespace dispatch::events
