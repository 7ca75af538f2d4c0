#include "batch_scheduler.hpp"

#include <algorithm>
#include <optional>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/model/conversions.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace dispatch::matching {

using namespace dispatch::engine::core::v1;

namespace {

constexpr uint64_t kRetryDelayMs = 1000;

} // namespace

BatchScheduler::BatchScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<CandidateSelector> selector,
                               std::shared_ptr<OfferBroadcaster> broadcaster, std::shared_ptr<RideStateMachine> state_machine,
                               std::shared_ptr<events::EventOutbox> outbox, dispatch::runtime::config::DispatchConfig config)
    : repository_(std::move(repository)),
      selector_(std::move(selector)),
      broadcaster_(std::move(broadcaster)),
      state_machine_(std::move(state_machine)),
      outbox_(std::move(outbox)),
      config_(std::move(config)),
      queue_(std::make_shared<DispatchQueue>()),
      timers_([this](const std::string& ride_id, uint32_t batch_number) {
        queue_->Enqueue(DispatchTask{ride_id, DispatchTask::Kind::kWindowElapsed, batch_number});
      }) {
}

BatchScheduler::~BatchScheduler() {
  Stop();
}

void BatchScheduler::Start() {
  if (!workers_.empty()) return;

  const uint32_t threads = std::max<uint32_t>(1, config_.worker_threads());
  for (uint32_t i = 0; i < threads; ++i) {
    auto worker = std::make_unique<DispatchWorker>(queue_, [this](const DispatchTask& task) { HandleTask(task); });
    worker->Start();
    workers_.push_back(std::move(worker));
  }
  timers_.Start();

  DISPATCH_LOG_INFO("Batch scheduler started", {observability::IntField("workers", threads)});
}

void BatchScheduler::Stop() {
  timers_.Stop();
  for (auto& worker : workers_) worker->Stop();
  workers_.clear();
}

void BatchScheduler::ScheduleRide(const std::string& ride_id) {
  {
    std::lock_guard lock(mutex_);
    if (!loops_.try_emplace(ride_id).second) {
      DISPATCH_LOG_WARN("Dispatch loop already running", {observability::StringField("ride_id", ride_id)});
      return;
    }
    observability::Metrics::Instance().SetActiveDispatchLoops(loops_.size());
  }
  queue_->Enqueue(DispatchTask{ride_id, DispatchTask::Kind::kStart, 0});
}

void BatchScheduler::OnRideSettled(const std::string& ride_id) {
  Finish(ride_id);
}

std::size_t BatchScheduler::Recover() {
  std::vector<db::model::RideRecord>                          searching;
  std::unordered_map<std::string, std::vector<db::model::OfferRecord>> offers;
  {
    auto tx   = repository_->Begin();
    searching = repository_->ListRidesByStatus(*tx, RIDE_STATUS_SEARCHING);
    for (const auto& ride : searching) offers[ride.id] = repository_->ListOffersForRide(*tx, ride.id);
    tx->Commit();
  }

  const uint64_t now_ms               = util::NowMillis();
  const uint64_t reconnect_deadline_ms = now_ms + config_.recovery_grace_ms();
  for (const auto& ride : searching) {
    Loop                    loop;
    std::optional<uint64_t> pending_deadline;
    std::unordered_set<uint32_t> batches;
    for (const auto& offer : offers[ride.id]) {
      loop.excluded.insert(offer.driver_id);
      batches.insert(offer.batch_number);
      loop.current_batch = std::max(loop.current_batch, offer.batch_number);
    }
    loop.batches_sent = static_cast<uint32_t>(batches.size());
    for (const auto& offer : offers[ride.id]) {
      if (offer.batch_number == loop.current_batch && offer.status == OFFER_STATUS_PENDING && offer.expires_at_ms > now_ms) {
        pending_deadline = offer.expires_at_ms;
      }
    }

    const uint32_t current_batch = loop.current_batch;
    {
      std::lock_guard lock(mutex_);
      if (!loops_.try_emplace(ride.id, std::move(loop)).second) continue;
    }

    // The registry starts empty; selecting now would find every driver unreachable.
    // A window elapsing for batch 0 selects the first batch without expiring anything.
    ArmIfActive(ride.id, std::max(pending_deadline.value_or(0), reconnect_deadline_ms), current_batch);
  }

  {
    std::lock_guard lock(mutex_);
    observability::Metrics::Instance().SetActiveDispatchLoops(loops_.size());
  }
  DISPATCH_LOG_INFO("Recovered dispatch loops", {observability::IntField("rides", static_cast<int64_t>(searching.size()))});
  return searching.size();
}

bool BatchScheduler::IsActive(const std::string& ride_id) const {
  std::lock_guard lock(mutex_);
  return loops_.contains(ride_id);
}

std::size_t BatchScheduler::ActiveLoops() const {
  std::lock_guard lock(mutex_);
  return loops_.size();
}

std::vector<std::string> BatchScheduler::ExcludedDrivers(const std::string& ride_id) const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> out;
  auto                     it = loops_.find(ride_id);
  if (it == loops_.end()) return out;
  out.assign(it->second.excluded.begin(), it->second.excluded.end());
  std::sort(out.begin(), out.end());
  return out;
}

void BatchScheduler::HandleTask(const DispatchTask& task) {
  try {
    Step(task);
  } catch (const std::exception& e) {
    DISPATCH_LOG_ERROR("Dispatch step failed, retrying", {observability::StringField("ride_id", task.ride_id), observability::StringField("error", e.what())});
    // A failed start comes back as kWindowElapsed for batch 0, which expires nothing.
    const uint32_t batch = task.kind == DispatchTask::Kind::kStart ? 0 : task.batch_number;
    ArmIfActive(task.ride_id, util::NowMillis() + kRetryDelayMs, batch);
  }
}

void BatchScheduler::Step(const DispatchTask& task) {
  observability::SpanScope span("BatchScheduler.Step");
  span.SetAttribute("ride.id", task.ride_id);

  Loop loop;
  {
    std::lock_guard lock(mutex_);
    auto            it = loops_.find(task.ride_id);
    if (it == loops_.end()) return;
    if (task.kind == DispatchTask::Kind::kWindowElapsed && task.batch_number != it->second.current_batch) return;
    loop = it->second;
  }

  if (task.kind == DispatchTask::Kind::kWindowElapsed && task.batch_number > 0) ExpireBatch(task.ride_id, task.batch_number);

  std::optional<db::model::RideRecord> ride;
  {
    auto tx = repository_->Begin();
    ride    = repository_->GetRide(*tx, task.ride_id);
    tx->Commit();
  }
  if (!ride.has_value() || ride->status != RIDE_STATUS_SEARCHING) {
    Finish(task.ride_id);
    return;
  }

  const uint64_t now_ms = util::NowMillis();
  if (config_.search_timeout_ms() > 0 && now_ms >= ride->created_at_ms + config_.search_timeout_ms()) {
    Exhaust(task.ride_id, events::kReasonSearchTimeout);
    return;
  }
  if (config_.max_batches() > 0 && loop.batches_sent >= config_.max_batches()) {
    Exhaust(task.ride_id, events::kReasonMaxBatchesReached);
    return;
  }

  for (;;) {
    CandidateQuery query;
    query.pickup             = model::PickupCoordinates(*ride);
    query.vehicle_type       = ride->vehicle_type;
    query.service_tier       = ride->service_tier;
    query.exclude_driver_ids = loop.excluded;
    query.batch_size         = config_.batch_size();

    auto candidates = selector_->SelectBatch(query);
    if (candidates.empty()) {
      span.AddEvent("no_candidates");
      Exhaust(task.ride_id, events::kReasonNoCandidates);
      return;
    }

    auto result = broadcaster_->Broadcast(*ride, candidates);
    if (result.ride_settled) {
      Finish(task.ride_id);
      return;
    }
    for (const auto& candidate : candidates) loop.excluded.insert(candidate.driver_id);

    if (result.offers.empty()) {
      // Every candidate was unreachable; they stay excluded and selection moves on.
      continue;
    }

    loop.batches_sent += 1;
    loop.current_batch = result.batch_number;
    span.AddEvent("batch_sent");
    span.SetAttribute("batch.number", static_cast<std::int64_t>(result.batch_number));
    {
      std::lock_guard lock(mutex_);
      auto            it = loops_.find(task.ride_id);
      if (it == loops_.end()) return;
      it->second = loop;
      timers_.Arm(task.ride_id, result.offers.front().expires_at_ms, result.batch_number);
    }
    return;
  }
}

void BatchScheduler::ExpireBatch(const std::string& ride_id, uint32_t batch_number) {
  std::vector<db::model::OfferRecord> expired;
  {
    auto tx = repository_->Begin();
    if (!repository_->GetRideForUpdate(*tx, ride_id).has_value()) return;
    db::ThrowIfError(repository_->ResolvePendingOffersForRide(*tx, ride_id, batch_number, OFFER_STATUS_EXPIRED, util::NowMillis(), expired),
                     "expire batch for ride " + ride_id);
    tx->Commit();
  }
  if (expired.empty()) return;

  std::vector<events::Notification> notifications;
  for (const auto& offer : expired) {
    notifications.push_back(events::Notification{offer.driver_id, events::RideRequestCancelled(ride_id, events::kReasonOfferExpired)});
  }
  outbox_->Publish(std::move(notifications));

  DISPATCH_LOG_INFO("Offer window elapsed", {observability::StringField("ride_id", ride_id), observability::IntField("batch", batch_number),
                                             observability::IntField("expired", static_cast<int64_t>(expired.size()))});
}

void BatchScheduler::Exhaust(const std::string& ride_id, std::string_view reason) {
  std::optional<db::model::RideRecord> settled;
  try {
    auto tx   = repository_->Begin();
    auto ride = repository_->GetRideForUpdate(*tx, ride_id);
    if (ride.has_value() && ride->status == RIDE_STATUS_SEARCHING) {
      settled = state_machine_->ApplyInTransaction(*tx, *ride, RIDE_STATUS_NO_DRIVERS_AVAILABLE, TransitionContext{"dispatcher", std::string(reason), ""},
                                                   util::NowMillis());
      tx->Commit();
    }
  } catch (const util::StateConflict& e) {
    DISPATCH_LOG_INFO("Ride settled while exhausting", {observability::StringField("ride_id", ride_id), observability::StringField("error", e.what())});
  }

  Finish(ride_id);
  if (!settled.has_value()) return;

  outbox_->Publish(settled->customer_id, events::NoDriversAvailable(ride_id, reason));
  DISPATCH_LOG_WARN("No drivers available", {observability::StringField("ride_id", ride_id), observability::StringField("reason", reason)});
}

void BatchScheduler::Finish(const std::string& ride_id) {
  std::lock_guard lock(mutex_);
  timers_.Cancel(ride_id);
  if (loops_.erase(ride_id) > 0) observability::Metrics::Instance().SetActiveDispatchLoops(loops_.size());
}

void BatchScheduler::ArmIfActive(const std::string& ride_id, uint64_t deadline_ms, uint32_t batch_number) {
  std::lock_guard lock(mutex_);
  if (!loops_.contains(ride_id)) return;
  timers_.Arm(ride_id, deadline_ms, batch_number);
}

} // namespace dispatch::matching
