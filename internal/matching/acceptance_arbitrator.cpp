#include "acceptance_arbitrator.hpp"

#include <optional>
#include <vector>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/model/ride_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace dispatch::matching {

using namespace dispatch::engine::core::v1;

namespace {

std::string_view OutcomeName(ArbitrationOutcome outcome) {
  switch (outcome) {
    case ARBITRATION_OUTCOME_WON:
      return "won";
    case ARBITRATION_OUTCOME_LOST_RACE:
      return "lost_race";
    case ARBITRATION_OUTCOME_EXPIRED:
      return "expired";
    case ARBITRATION_OUTCOME_RIDE_NOT_SEARCHING:
      return "ride_not_searching";
    case ARBITRATION_OUTCOME_OFFER_NOT_FOUND:
      return "offer_not_found";
    default:
      return "unspecified";
  }
}

// The driver's offer for the ride: the pending one if any, else the latest.
std::optional<db::model::OfferRecord> DriverOffer(db::Repository& repository, db::Transaction& tx, const std::string& ride_id, const std::string& driver_id) {
  std::optional<db::model::OfferRecord> found;
  for (auto& offer : repository.ListOffersForRide(tx, ride_id)) {
    if (offer.driver_id != driver_id) continue;
    if (offer.status == OFFER_STATUS_PENDING) return offer;
    found = std::move(offer);
  }
  return found;
}

// Why an accept cannot (or could not) go through, from committed state.
AcceptResult Diagnose(const db::model::RideRecord& ride, const db::model::OfferRecord& offer, const std::string& driver_id, uint64_t now_ms) {
  AcceptResult result;
  result.ride_id  = ride.id;
  result.offer_id = offer.id;

  if (ride.status != RIDE_STATUS_SEARCHING) {
    if (model::HoldsDriver(ride.status) && ride.assigned_driver_id != driver_id) {
      result.outcome = ARBITRATION_OUTCOME_LOST_RACE;
      result.message = "ride was accepted by another driver";
    } else {
      result.outcome = ARBITRATION_OUTCOME_RIDE_NOT_SEARCHING;
      result.message = "ride is " + std::string(model::ToString(ride.status));
    }
    return result;
  }

  switch (offer.status) {
    case OFFER_STATUS_PENDING:
      if (offer.expires_at_ms <= now_ms) {
        result.outcome = ARBITRATION_OUTCOME_EXPIRED;
        result.message = "offer window elapsed";
      } else {
        result.outcome = ARBITRATION_OUTCOME_LOST_RACE;
        result.message = "offer changed concurrently";
      }
      break;
    case OFFER_STATUS_SUPERSEDED:
    case OFFER_STATUS_ACCEPTED:
      result.outcome = ARBITRATION_OUTCOME_LOST_RACE;
      result.message = "ride was accepted by another driver";
      break;
    default:
      result.outcome = ARBITRATION_OUTCOME_EXPIRED;
      result.message = "offer is " + std::string(model::ToString(offer.status));
      break;
  }
  return result;
}

} // namespace

AcceptanceArbitrator::AcceptanceArbitrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<RideStateMachine> state_machine,
                                           std::shared_ptr<events::EventOutbox> outbox, std::shared_ptr<SettlementListener> listener)
    : repository_(std::move(repository)),
      state_machine_(std::move(state_machine)),
      outbox_(std::move(outbox)),
      listener_(std::move(listener)) {
}

AcceptResult AcceptanceArbitrator::TryAccept(const std::string& ride_id, const std::string& driver_id) {
  observability::SpanScope span("AcceptanceArbitrator.TryAccept");
  span.SetAttribute("ride.id", ride_id);
  span.SetAttribute("driver.id", driver_id);

  const uint64_t now_ms = util::NowMillis();

  db::model::RideRecord               assigned;
  db::model::OfferRecord              winner;
  std::vector<db::model::OfferRecord> superseded;
  {
    auto tx   = repository_->Begin();
    auto ride = repository_->GetRideForUpdate(*tx, ride_id);
    if (!ride.has_value()) throw util::NotFound("accept: ride " + ride_id + " not found");

    auto offer = DriverOffer(*repository_, *tx, ride_id, driver_id);
    if (!offer.has_value()) {
      return Finish(AcceptResult{ARBITRATION_OUTCOME_OFFER_NOT_FOUND, ride_id, "", "driver holds no offer for this ride"}, driver_id);
    }

    if (ride->status != RIDE_STATUS_SEARCHING || offer->status != OFFER_STATUS_PENDING || offer->expires_at_ms <= now_ms) {
      return Finish(Diagnose(*ride, *offer, driver_id, now_ms), driver_id);
    }

    auto accepted = repository_->AcceptPendingOffer(*tx, offer->id, now_ms);
    if (accepted.code == db::ErrorCode::Conflict || accepted.code == db::ErrorCode::SerializationFailure ||
        accepted.code == db::ErrorCode::AlreadyExists || accepted.code == db::ErrorCode::ConstraintViolation) {
      tx->Rollback();
      auto read = repository_->Begin();
      auto now_ride  = repository_->GetRide(*read, ride_id);
      auto now_offer = repository_->GetOffer(*read, offer->id);
      read->Commit();
      return Finish(Diagnose(now_ride.value_or(*ride), now_offer.value_or(*offer), driver_id, now_ms), driver_id);
    }
    db::ThrowIfError(accepted, "accept offer " + offer->id);

    try {
      assigned = state_machine_->ApplyInTransaction(*tx, *ride, RIDE_STATUS_ASSIGNED, TransitionContext{"driver", "offer_accepted", driver_id}, now_ms);
    } catch (const util::StateConflict&) {
      tx->Rollback();
      auto read     = repository_->Begin();
      auto now_ride = repository_->GetRide(*read, ride_id);
      read->Commit();
      return Finish(Diagnose(now_ride.value_or(*ride), *offer, driver_id, now_ms), driver_id);
    }

    db::ThrowIfError(repository_->ResolvePendingOffersForRide(*tx, ride_id, std::nullopt, OFFER_STATUS_SUPERSEDED, now_ms, superseded),
                     "supersede offers for ride " + ride_id);
    tx->Commit();

    winner                 = *offer;
    winner.status          = OFFER_STATUS_ACCEPTED;
    winner.responded_at_ms = now_ms;
  }

  std::vector<events::Notification> notifications;
  for (const auto& loser : superseded) {
    notifications.push_back(events::Notification{loser.driver_id, events::RideRequestCancelled(ride_id, events::kReasonAcceptedByAnotherDriver)});
  }
  notifications.push_back(events::Notification{assigned.customer_id, events::DriverAssigned(ride_id, driver_id, winner.eta_minutes)});
  outbox_->Publish(std::move(notifications));

  if (listener_) listener_->OnRideSettled(ride_id);

  DISPATCH_LOG_INFO("Ride assigned", {observability::StringField("ride_id", ride_id), observability::StringField("driver_id", driver_id),
                                      observability::IntField("superseded", static_cast<int64_t>(superseded.size()))});
  return Finish(AcceptResult{ARBITRATION_OUTCOME_WON, ride_id, winner.id, "ride assigned"}, driver_id);
}

AcceptResult AcceptanceArbitrator::AcceptOffer(const std::string& offer_id, const std::string& driver_id) {
  std::optional<db::model::OfferRecord> offer;
  {
    auto tx = repository_->Begin();
    offer   = repository_->GetOffer(*tx, offer_id);
    tx->Commit();
  }
  if (!offer.has_value()) {
    return Finish(AcceptResult{ARBITRATION_OUTCOME_OFFER_NOT_FOUND, "", offer_id, "offer not found"}, driver_id);
  }
  if (offer->driver_id != driver_id) throw util::PermissionDenied("offer " + offer_id + " was not made to driver " + driver_id);

  return TryAccept(offer->ride_id, driver_id);
}

bool AcceptanceArbitrator::RejectOffer(const std::string& offer_id, const std::string& driver_id, const std::string& reason) {
  auto tx    = repository_->Begin();
  auto offer = repository_->GetOffer(*tx, offer_id);
  if (!offer.has_value()) throw util::NotFound("reject: offer " + offer_id + " not found");
  if (offer->driver_id != driver_id) throw util::PermissionDenied("offer " + offer_id + " was not made to driver " + driver_id);

  auto result = repository_->ResolvePendingOffer(*tx, offer_id, OFFER_STATUS_REJECTED, reason, util::NowMillis());
  if (result.code == db::ErrorCode::Conflict) {
    tx->Rollback();
    return false;
  }
  db::ThrowIfError(result, "reject offer " + offer_id);
  tx->Commit();

  DISPATCH_LOG_INFO("Offer rejected", {observability::StringField("offer_id", offer_id), observability::StringField("driver_id", driver_id),
                                       observability::StringField("reason", reason)});
  return true;
}

AcceptResult AcceptanceArbitrator::Finish(AcceptResult result, const std::string& driver_id) {
  observability::Metrics::Instance().RecordArbitrationOutcome(OutcomeName(result.outcome));
  if (result.outcome != ARBITRATION_OUTCOME_WON) {
    DISPATCH_LOG_INFO("Accept refused", {observability::StringField("ride_id", result.ride_id), observability::StringField("driver_id", driver_id),
                                         observability::StringField("outcome", OutcomeName(result.outcome)),
                                         observability::StringField("reason", result.message)});
  }
  return result;
}

} // namespace dispatch::matching
