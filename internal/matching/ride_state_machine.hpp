#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace dispatch::matching {

using dispatch::engine::core::v1::RideStatus;

struct TransitionContext {
  std::string actor;
  std::string reason;
  // Required when moving to assigned.
  std::string driver_id;
};

/*
  RideStateMachine

  The only writer of ride status. Every transition is:
    1. validated against the lifecycle table (InvalidTransition otherwise)
    2. written with compare-and-set on the status it was read in
       (StateConflict when another writer got there first)
    3. recorded as one history row
    4. mirrored onto driver availability (busy on assigned, idle again on
       completed/cancelled)
  all inside the caller's transaction.
*/
class RideStateMachine {
 public:
  explicit RideStateMachine(std::shared_ptr<db::Repository> repository);

  // Applies `to` on top of `current` inside `tx`. Returns the written row.
  db::model::RideRecord ApplyInTransaction(db::Transaction& tx, const db::model::RideRecord& current, RideStatus to, const TransitionContext& context,
                                           uint64_t now_ms);

  // Reads the ride, applies the transition and commits.
  db::model::RideRecord Transition(const std::string& ride_id, RideStatus to, const TransitionContext& context);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace dispatch::matching
