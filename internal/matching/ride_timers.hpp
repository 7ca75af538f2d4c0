#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace dispatch::matching {

/*
  RideTimers

  One cancellable deadline per ride, driven by a single timer thread.
  Arming a ride again replaces its previous deadline. The callback runs on
  the timer thread and must only hand work off (e.g. enqueue a task).
*/
class RideTimers {
 public:
  using Callback = std::function<void(const std::string& ride_id, uint32_t batch_number)>;

  explicit RideTimers(Callback callback);
  ~RideTimers();

  RideTimers(const RideTimers&)            = delete;
  RideTimers& operator=(const RideTimers&) = delete;

  void Start();
  void Stop();

  // deadline is unix millis
  void Arm(const std::string& ride_id, uint64_t deadline_ms, uint32_t batch_number);
  bool Cancel(const std::string& ride_id);

  bool        IsArmed(const std::string& ride_id) const;
  std::size_t Armed() const;

 private:
  struct Deadline {
    uint64_t deadline_ms  = 0;
    uint32_t batch_number = 0;
    uint64_t generation   = 0;
  };

  void Run();

  Callback callback_;

  mutable std::mutex                                          mutex_;
  std::condition_variable                                     cv_;
  std::unordered_map<std::string, Deadline>                   by_ride_;
  std::multimap<uint64_t, std::pair<std::string, uint64_t>>   by_deadline_;
  uint64_t                                                    next_generation_ = 0;
  bool                                                        stopping_        = false;
  std::thread                                                 thread_;
};

} // namespace dispatch::matching
