#include "dispatch_worker.hpp"

#include "internal/observability/logging.hpp"

namespace dispatch::matching {

DispatchWorker::DispatchWorker(std::shared_ptr<DispatchQueue> queue, Handler handler) : queue_(std::move(queue)), handler_(std::move(handler)) {
}

DispatchWorker::~DispatchWorker() {
  Stop();
}

void DispatchWorker::Start() {
  running_ = true;
  thread_  = std::thread(&DispatchWorker::Run, this);
}

void DispatchWorker::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void DispatchWorker::Run() {
  while (running_) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      handler_(*task);
    } catch (const std::exception& e) {
      DISPATCH_LOG_ERROR("Dispatch step failed", {observability::StringField("ride_id", task->ride_id), observability::StringField("error", e.what())});
    }
  }
}

} // namespace dispatch::matching
