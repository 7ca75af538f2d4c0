#include "offer_broadcaster.hpp"

#include "internal/db/api/throw_if_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace dispatch::matching {

using namespace dispatch::engine::core::v1;

OfferBroadcaster::OfferBroadcaster(std::shared_ptr<db::Repository> repository, std::shared_ptr<realtime::ConnectionRegistry> registry,
                                   std::shared_ptr<events::EventOutbox> outbox, dispatch::runtime::config::DispatchConfig config)
    : repository_(std::move(repository)), registry_(std::move(registry)), outbox_(std::move(outbox)), config_(std::move(config)) {
}

BroadcastResult OfferBroadcaster::Broadcast(const db::model::RideRecord& ride, const std::vector<Candidate>& candidates) {
  observability::SpanScope span("OfferBroadcaster.Broadcast");
  span.SetAttribute("ride.id", ride.id);

  BroadcastResult result;

  const uint64_t now_ms     = util::NowMillis();
  const uint64_t expires_at = now_ms + config_.offer_window_ms();

  auto tx      = repository_->Begin();
  // A cancel or accept committing meanwhile waits for this batch, then expires or supersedes it.
  auto current = repository_->GetRideForUpdate(*tx, ride.id);
  if (!current.has_value() || current->status != RIDE_STATUS_SEARCHING) {
    tx->Rollback();
    result.ride_settled = true;
    return result;
  }

  const uint32_t batch_number = repository_->MaxBatchNumber(*tx, ride.id) + 1;
  for (const auto& candidate : candidates) {
    if (!registry_->IsOnline(candidate.driver_id)) {
      DISPATCH_LOG_WARN("ConnectionUnavailable: skipping candidate",
                        {observability::StringField("ride_id", ride.id), observability::StringField("driver_id", candidate.driver_id)});
      result.unreachable.push_back(candidate.driver_id);
      continue;
    }

    db::model::OfferRecord offer;
    offer.id            = util::NewId();
    offer.ride_id       = ride.id;
    offer.driver_id     = candidate.driver_id;
    offer.batch_number  = batch_number;
    offer.status        = OFFER_STATUS_PENDING;
    offer.distance_km   = candidate.distance_km;
    offer.eta_minutes   = candidate.eta_minutes;
    offer.created_at_ms = now_ms;
    offer.expires_at_ms = expires_at;
    db::ThrowIfError(repository_->InsertOffer(*tx, offer), "insert offer");
    result.offers.push_back(std::move(offer));
  }

  if (result.offers.empty()) {
    tx->Rollback();
    return result;
  }
  tx->Commit();
  result.batch_number = batch_number;

  std::vector<events::Notification> notifications;
  notifications.reserve(result.offers.size());
  for (const auto& offer : result.offers) {
    notifications.push_back(events::Notification{offer.driver_id, events::RideRequestNew(*current, offer)});
  }
  outbox_->Publish(std::move(notifications));

  observability::Metrics::Instance().ObserveBatchSize(candidates.size());
  observability::Metrics::Instance().RecordOffersCreated(result.offers.size());
  DISPATCH_LOG_INFO("Batch broadcast", {observability::StringField("ride_id", ride.id), observability::IntField("batch", batch_number),
                                        observability::IntField("offers", static_cast<int64_t>(result.offers.size())),
                                        observability::IntField("unreachable", static_cast<int64_t>(result.unreachable.size()))});
  return result;
}

} // namespace dispatch::matching
