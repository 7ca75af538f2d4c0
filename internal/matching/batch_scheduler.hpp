#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_outbox.hpp"
#include "internal/matching/candidate_selector.hpp"
#include "internal/matching/dispatch_queue.hpp"
#include "internal/matching/dispatch_worker.hpp"
#include "internal/matching/offer_broadcaster.hpp"
#include "internal/matching/ride_state_machine.hpp"
#include "internal/matching/ride_timers.hpp"
#include "internal/matching/settlement_listener.hpp"

namespace dispatch::matching {

/*
  BatchScheduler

  Owns every active dispatch loop:

    select batch -> empty? no_drivers_available, stop
                 -> broadcast, arm window timer
    window fires -> expire the batch's pending offers, exclude the batch,
                    select again
    settled      -> timer cancelled, loop dropped

  Loop steps run on a worker pool fed by a DispatchQueue; a single timer
  thread holds one deadline per ride. Batch N+1 is only selected after
  batch N's window has elapsed. Exhaustion is: no candidates left,
  max_batches reached (0 = unlimited), or search_timeout since the ride
  was created.

  The loop table and timers are caches; Recover() rebuilds them from
  storage after a restart, giving drivers recovery_grace_ms to reconnect
  before the next batch is selected.
*/
class BatchScheduler final : public SettlementListener {
 public:
  BatchScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<CandidateSelector> selector, std::shared_ptr<OfferBroadcaster> broadcaster,
                 std::shared_ptr<RideStateMachine> state_machine, std::shared_ptr<events::EventOutbox> outbox,
                 dispatch::runtime::config::DispatchConfig config);
  ~BatchScheduler() override;

  void Start();
  void Stop();

  // Starts the dispatch loop for a searching ride. No-op if one is running.
  void ScheduleRide(const std::string& ride_id);

  // Stops the loop. Safe to call for rides without a loop.
  void OnRideSettled(const std::string& ride_id) override;

  // Re-arms every ride still `searching` in storage. Returns how many.
  // No batch is selected before recovery_grace_ms has passed, and a live
  // batch keeps its window.
  std::size_t Recover();

  bool        IsActive(const std::string& ride_id) const;
  std::size_t ActiveLoops() const;

  // Drivers already offered this ride by the running loop.
  std::vector<std::string> ExcludedDrivers(const std::string& ride_id) const;

 private:
  struct Loop {
    uint32_t                        batches_sent  = 0;
    uint32_t                        current_batch = 0;
    std::unordered_set<std::string> excluded;
  };

  void HandleTask(const DispatchTask& task);
  void Step(const DispatchTask& task);

  void ExpireBatch(const std::string& ride_id, uint32_t batch_number);
  void Exhaust(const std::string& ride_id, std::string_view reason);
  void Finish(const std::string& ride_id);

  void ArmIfActive(const std::string& ride_id, uint64_t deadline_ms, uint32_t batch_number);

  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<CandidateSelector>        selector_;
  std::shared_ptr<OfferBroadcaster>         broadcaster_;
  std::shared_ptr<RideStateMachine>         state_machine_;
  std::shared_ptr<events::EventOutbox>      outbox_;
  dispatch::runtime::config::DispatchConfig config_;

  std::shared_ptr<DispatchQueue>               queue_;
  std::vector<std::unique_ptr<DispatchWorker>> workers_;
  RideTimers                                   timers_;

  mutable std::mutex                    mutex_;
  std::unordered_map<std::string, Loop> loops_;
};

} // namespace dispatch::matching
