#include "ride_timers.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace dispatch::matching {

RideTimers::RideTimers(Callback callback) : callback_(std::move(callback)) {
}

RideTimers::~RideTimers() {
  Stop();
}

void RideTimers::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_   = std::thread(&RideTimers::Run, this);
}

void RideTimers::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void RideTimers::Arm(const std::string& ride_id, uint64_t deadline_ms, uint32_t batch_number) {
  {
    std::lock_guard lock(mutex_);
    const uint64_t  generation = ++next_generation_;
    by_ride_[ride_id]          = Deadline{deadline_ms, batch_number, generation};
    by_deadline_.emplace(deadline_ms, std::make_pair(ride_id, generation));
  }
  cv_.notify_one();
}

bool RideTimers::Cancel(const std::string& ride_id) {
  std::lock_guard lock(mutex_);
  // The by_deadline_ entry goes stale and is skipped when it comes due.
  return by_ride_.erase(ride_id) > 0;
}

bool RideTimers::IsArmed(const std::string& ride_id) const {
  std::lock_guard lock(mutex_);
  return by_ride_.contains(ride_id);
}

std::size_t RideTimers::Armed() const {
  std::lock_guard lock(mutex_);
  return by_ride_.size();
}

void RideTimers::Run() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    if (by_deadline_.empty()) {
      cv_.wait(lock, [&] { return stopping_ || !by_deadline_.empty(); });
      continue;
    }

    auto           next   = by_deadline_.begin();
    const uint64_t now_ms = util::NowMillis();
    if (next->first > now_ms) {
      cv_.wait_for(lock, std::chrono::milliseconds(next->first - now_ms));
      continue;
    }

    auto [ride_id, generation] = next->second;
    by_deadline_.erase(next);

    auto armed = by_ride_.find(ride_id);
    if (armed == by_ride_.end() || armed->second.generation != generation) continue;
    const uint32_t batch_number = armed->second.batch_number;
    by_ride_.erase(armed);

    lock.unlock();
    try {
      callback_(ride_id, batch_number);
    } catch (const std::exception& e) {
      DISPATCH_LOG_ERROR("Ride timer callback failed", {observability::StringField("ride_id", ride_id), observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace dispatch::matching
