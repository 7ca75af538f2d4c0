#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_outbox.hpp"
#include "internal/matching/candidate_selector.hpp"
#include "internal/realtime/connection_registry.hpp"

namespace dispatch::matching {

struct BroadcastResult {
  // 0 when no offer was written.
  uint32_t                           batch_number = 0;
  std::vector<db::model::OfferRecord> offers;
  // Candidates skipped for lack of a live connection.
  std::vector<std::string> unreachable;
  // Set when the ride had already left `searching`; nothing was written.
  bool ride_settled = false;
};

/*
  OfferBroadcaster

  Persists one pending offer per reachable candidate under a fresh batch
  number, all sharing one expires_at, then (after commit) pushes
  ride:request:new to each of them. Never touches driver availability.
*/
class OfferBroadcaster {
 public:
  OfferBroadcaster(std::shared_ptr<db::Repository> repository, std::shared_ptr<realtime::ConnectionRegistry> registry,
                   std::shared_ptr<events::EventOutbox> outbox, dispatch::runtime::config::DispatchConfig config);

  BroadcastResult Broadcast(const db::model::RideRecord& ride, const std::vector<Candidate>& candidates);

 private:
  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<realtime::ConnectionRegistry> registry_;
  std::shared_ptr<events::EventOutbox>          outbox_;
  dispatch::runtime::config::DispatchConfig     config_;
};

} // namespace dispatch::matching
