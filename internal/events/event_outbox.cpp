#include "event_outbox.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace dispatch::events {

EventOutbox::EventOutbox(std::shared_ptr<realtime::ConnectionRegistry> registry) : registry_(std::move(registry)) {
}

EventOutbox::~EventOutbox() {
  Stop();
}

void EventOutbox::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_   = std::thread(&EventOutbox::Run, this);
}

void EventOutbox::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void EventOutbox::Publish(std::string user_id, RealtimeEvent event) {
  std::vector<Notification> batch;
  batch.push_back(Notification{std::move(user_id), std::move(event)});
  Publish(std::move(batch));
}

void EventOutbox::Publish(std::vector<Notification> notifications) {
  if (notifications.empty()) return;

  const auto now = util::ToProto(util::Now());
  {
    std::lock_guard lock(mutex_);
    if (stopping_) {
      dropped_ += notifications.size();
      DISPATCH_LOG_WARN("Outbox stopped, events dropped", {observability::StringField("event", notifications.front().event.name()),
                                                            observability::IntField("count", static_cast<int64_t>(notifications.size()))});
      return;
    }
    for (auto& notification : notifications) {
      *notification.event.mutable_emitted_at() = now;
      queue_.push_back(std::move(notification));
    }
  }
  cv_.notify_one();
}

void EventOutbox::Flush() {
  std::unique_lock lock(mutex_);
  drained_cv_.wait(lock, [&] {
    return (queue_.empty() && !busy_) || !thread_.joinable();
  });
}

void EventOutbox::Run() {
  for (;;) {
    Notification next;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] {
        return stopping_ || !queue_.empty();
      });
      if (queue_.empty()) {
        drained_cv_.notify_all();
        return;
      }
      next = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }

    Deliver(next);

    {
      std::lock_guard lock(mutex_);
      busy_ = false;
      if (queue_.empty()) drained_cv_.notify_all();
    }
  }
}

void EventOutbox::Deliver(const Notification& notification) {
  try {
    if (registry_->Send(notification.user_id, notification.event) == realtime::SendResult::kDelivered) {
      ++delivered_;
      return;
    }
    ++dropped_;
    DISPATCH_LOG_INFO("Recipient not connected, event dropped",
                      {observability::StringField("user_id", notification.user_id), observability::StringField("event", notification.event.name())});
  } catch (const std::exception& e) {
    ++dropped_;
    DISPATCH_LOG_ERROR("Event delivery failed", {observability::StringField("user_id", notification.user_id),
                                                 observability::StringField("event", notification.event.name()), observability::StringField("error", e.what())});
  }
}

} // namespace dispatch::events
