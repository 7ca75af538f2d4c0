#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace dispatch::matching {

/*
  One step of a ride's dispatch loop.
*/
struct DispatchTask {
  enum class Kind {
    kStart,         // select and broadcast the first batch
    kWindowElapsed, // expire `batch_number`, then continue
  };

  std::string ride_id;
  Kind        kind         = Kind::kStart;
  uint32_t    batch_number = 0;
};

/*
  Thread-safe blocking queue feeding the dispatch workers.
*/
class DispatchQueue {
 public:
  void Enqueue(DispatchTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<DispatchTask> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  std::queue<DispatchTask> queue_;
  bool                     shutdown_ = false;
};

} // namespace dispatch::matching
