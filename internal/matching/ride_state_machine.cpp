#include "ride_state_machine.hpp"

#include "internal/db/api/throw_if_error.hpp"
#include "internal/model/ride_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace dispatch::matching {

using namespace dispatch::engine::core::v1;

namespace {

void MarkDriverAvailability(db::Repository& repository, db::Transaction& tx, const std::string& driver_id, bool available, uint64_t now_ms) {
  auto result = repository.SetDriverAvailable(tx, driver_id, available, now_ms);
  if (result.code == db::ErrorCode::NotFound) {
    DISPATCH_LOG_WARN("Driver has no availability record", {observability::StringField("driver_id", driver_id)});
    return;
  }
  db::ThrowIfError(result, "update driver availability");
}

} // namespace

RideStateMachine::RideStateMachine(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::RideRecord RideStateMachine::ApplyInTransaction(db::Transaction& tx, const db::model::RideRecord& current, RideStatus to,
                                                           const TransitionContext& context, uint64_t now_ms) {
  const RideStatus from = current.status;
  if (!model::CanTransition(from, to)) {
    DISPATCH_LOG_ERROR("Rejected ride transition", {observability::StringField("ride_id", current.id), observability::StringField("from", model::ToString(from)),
                                                    observability::StringField("to", model::ToString(to)), observability::StringField("actor", context.actor)});
    throw util::InvalidTransition("ride " + current.id + ": " + std::string(model::ToString(from)) + " -> " + std::string(model::ToString(to)) +
                                  " is not allowed");
  }

  auto next   = current;
  next.status = to;

  std::string history_driver = current.assigned_driver_id;
  switch (to) {
    case RIDE_STATUS_ASSIGNED:
      if (context.driver_id.empty()) throw util::InvalidArgument("ride " + current.id + ": assignment requires a driver");
      next.assigned_driver_id = context.driver_id;
      next.assigned_at_ms     = now_ms;
      history_driver          = context.driver_id;
      break;
    case RIDE_STATUS_ARRIVED:
      next.arrived_at_ms = now_ms;
      break;
    case RIDE_STATUS_IN_PROGRESS:
      next.started_at_ms = now_ms;
      break;
    case RIDE_STATUS_COMPLETED:
      next.completed_at_ms = now_ms;
      break;
    case RIDE_STATUS_CANCELLED:
      next.cancelled_at_ms     = now_ms;
      next.cancellation_reason = context.reason;
      next.assigned_driver_id.clear();
      break;
    default:
      break;
  }

  db::ThrowIfError(repository_->UpdateRideIfStatus(tx, next, from), "ride " + current.id + " " + std::string(model::ToString(to)));

  db::model::RideHistoryRecord history;
  history.ride_id       = current.id;
  history.from_status   = from;
  history.to_status     = to;
  history.actor         = context.actor;
  history.reason        = context.reason;
  history.driver_id     = history_driver;
  history.created_at_ms = now_ms;
  db::ThrowIfError(repository_->AppendRideHistory(tx, history), "append ride history");

  if (to == RIDE_STATUS_ASSIGNED) {
    MarkDriverAvailability(*repository_, tx, context.driver_id, false, now_ms);
  } else if ((to == RIDE_STATUS_COMPLETED || to == RIDE_STATUS_CANCELLED) && !current.assigned_driver_id.empty()) {
    MarkDriverAvailability(*repository_, tx, current.assigned_driver_id, true, now_ms);
  }

  if (model::IsTerminal(to)) {
    tx.AfterCommit([to] { observability::Metrics::Instance().RecordRideTerminal(model::ToString(to)); });
  }
  return next;
}

db::model::RideRecord RideStateMachine::Transition(const std::string& ride_id, RideStatus to, const TransitionContext& context) {
  auto tx      = repository_->Begin();
  auto current = repository_->GetRideForUpdate(*tx, ride_id);
  if (!current.has_value()) throw util::NotFound("ride " + ride_id + " not found");

  auto next = ApplyInTransaction(*tx, *current, to, context, util::NowMillis());
  tx->Commit();

  DISPATCH_LOG_INFO("Ride transitioned", {observability::StringField("ride_id", ride_id), observability::StringField("from", model::ToString(current->status)),
                                          observability::StringField("to", model::ToString(to)), observability::StringField("actor", context.actor)});
  return next;
}

} // namespace dispatch::matching
