#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

#include "dispatch_queue.hpp"

namespace dispatch::matching {

/*
  Background worker running dispatch loop steps.

  Pulls tasks from the shared DispatchQueue until it is shut down.
*/
class DispatchWorker {
 public:
  using Handler = std::function<void(const DispatchTask&)>;

  DispatchWorker(std::shared_ptr<DispatchQueue> queue, Handler handler);
  ~DispatchWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<DispatchQueue> queue_;
  Handler                        handler_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace dispatch::matching
