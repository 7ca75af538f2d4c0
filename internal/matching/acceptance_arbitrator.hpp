#pragma once

#include <memory>
#include <string>

#include "dispatch/engine/core/v1/types.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_outbox.hpp"
#include "internal/matching/ride_state_machine.hpp"
#include "internal/matching/settlement_listener.hpp"

namespace dispatch::matching {

using dispatch::engine::core::v1::ArbitrationOutcome;

struct AcceptResult {
  ArbitrationOutcome outcome = dispatch::engine::core::v1::ARBITRATION_OUTCOME_UNSPECIFIED;
  std::string        ride_id;
  std::string        offer_id;
  std::string        message;
};

/*
  AcceptanceArbitrator

  Resolves the accept race. In one transaction:
    offer   pending -> accepted   (unexpired, ride searching)
    ride    searching -> assigned (compare-and-set)
    others  pending -> superseded
    driver  marked unavailable, history appended
  Exactly one concurrent caller can get through; everyone else gets a
  typed outcome and nothing is written for them.

  After commit: losers get ride:request:cancelled, the customer gets
  ride:driver:assigned, and the settlement listener stops the dispatch loop.
*/
class AcceptanceArbitrator {
 public:
  AcceptanceArbitrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<RideStateMachine> state_machine,
                       std::shared_ptr<events::EventOutbox> outbox, std::shared_ptr<SettlementListener> listener);

  AcceptResult TryAccept(const std::string& ride_id, const std::string& driver_id);

  // Looks up the offer; PermissionDenied if it belongs to another driver.
  AcceptResult AcceptOffer(const std::string& offer_id, const std::string& driver_id);

  // pending -> rejected. Returns false when the offer was no longer pending.
  bool RejectOffer(const std::string& offer_id, const std::string& driver_id, const std::string& reason);

 private:
  AcceptResult Finish(AcceptResult result, const std::string& driver_id);

  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<RideStateMachine>    state_machine_;
  std::shared_ptr<events::EventOutbox> outbox_;
  std::shared_ptr<SettlementListener>  listener_;
};

} // namespace dispatch::matching
