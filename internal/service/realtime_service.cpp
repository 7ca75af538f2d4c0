#include "realtime_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/db/api/throw_if_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "observe_rpc.hpp"

namespace dispatch::service {

using namespace dispatch::engine::v1;

// ------------------------------------------------------------------
// RealtimeSession
// ------------------------------------------------------------------

RealtimeSession::RealtimeSession(std::shared_ptr<dispatch::realtime::ConnectionRegistry> registry, std::string user_id, std::string connection_id)
    : registry_(std::move(registry)), user_id_(std::move(user_id)), connection_id_(std::move(connection_id)) {
}

RealtimeSession::~RealtimeSession() {
  Close();
}

bool RealtimeSession::Push(const RealtimeEvent& event) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return false;
    if (queue_.size() >= kMaxQueuedEvents) {
      DISPATCH_LOG_WARN("Realtime session queue full", {dispatch::observability::StringField("connection_id", connection_id_),
                                                        dispatch::observability::StringField("event", event.name())});
      return false;
    }
    queue_.push_back(event);
  }
  cv_.notify_one();
  return true;
}

std::optional<RealtimeEvent> RealtimeSession::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });
  if (queue_.empty()) return std::nullopt;

  auto event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

bool RealtimeSession::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

void RealtimeSession::Close() {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    closed_ = true;
  }
  cv_.notify_all();
  registry_->Unregister(connection_id_);
}

// ------------------------------------------------------------------
// RealtimeService
// ------------------------------------------------------------------

RealtimeService::RealtimeService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  ctx_.registry->SetPresenceListener([repository = ctx_.repository](const std::string& user_id, UserType user_type, bool online) {
    if (user_type != USER_TYPE_DRIVER) return;

    const uint64_t now_ms = dispatch::util::NowMillis();
    auto           tx     = repository->Begin();
    auto           result = repository->SetDriverOnline(*tx, user_id, online, now_ms);
    if (result.code == dispatch::db::ErrorCode::NotFound && online) {
      dispatch::db::model::DriverAvailabilityRecord driver;
      driver.driver_id          = user_id;
      driver.is_online          = true;
      driver.is_available       = true;
      driver.last_seen_at_ms    = now_ms;
      driver.available_since_ms = now_ms;
      result                    = repository->UpsertDriverAvailability(*tx, driver);
    } else if (result.code == dispatch::db::ErrorCode::NotFound) {
      return;
    }
    dispatch::db::ThrowIfError(result, "mirror presence for driver " + user_id);
    tx->Commit();

    DISPATCH_LOG_INFO("Driver presence changed", {dispatch::observability::StringField("driver_id", user_id), dispatch::observability::BoolField("online", online)});
  });
}

std::shared_ptr<RealtimeSession> RealtimeService::Connect(const ConnectRequest& req) {
  return ObserveRpc("RealtimeService.Connect", "", [&] {
    if (req.user_id().empty()) {
      throw dispatch::util::InvalidArgument("user_id is required");
    }
    if (req.user_type() != USER_TYPE_DRIVER && req.user_type() != USER_TYPE_CUSTOMER) {
      throw dispatch::util::InvalidArgument("user_type must be driver or customer");
    }

    auto session = std::make_shared<RealtimeSession>(ctx_.registry, req.user_id(), dispatch::util::NewId());
    ctx_.registry->Register(req.user_id(), session->ConnectionId(), req.user_type(), [weak = std::weak_ptr<RealtimeSession>(session)](const RealtimeEvent& event) {
      auto target = weak.lock();
      return target && target->Push(event);
    });
    return session;
  });
}

} // namespace dispatch::service
