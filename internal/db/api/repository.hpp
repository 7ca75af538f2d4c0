#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/driver_availability_record.hpp"
#include "internal/db/model/offer_record.hpp"
#include "internal/db/model/ride_history_record.hpp"
#include "internal/db/model/ride_record.hpp"

namespace dispatch::db {

using dispatch::engine::core::v1::OfferStatus;
using dispatch::engine::core::v1::RideStatus;

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes take a Transaction
  - Reads inside a transaction see its writes
  - Conditional writes (the *If* / *Pending* family) are evaluated by the
    storage layer and report ErrorCode::Conflict when their predicate fails;
    nothing is written in that case
  - Offers and history rows are never deleted

  The DB is the source of truth for:
    ride status and assignment
    offers and their outcomes
    driver availability
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Rides
  // ---------------------------------------------------------------------

  virtual Result InsertRide(Transaction&, const model::RideRecord&) = 0;

  virtual std::optional<model::RideRecord> GetRide(Transaction&, const std::string& ride_id) = 0;

  // GetRide that also holds the ride's write lock until the transaction ends.
  // Transactions that write a ride's offers take it before touching any offer,
  // so ride-then-offers is the only lock order.
  virtual std::optional<model::RideRecord> GetRideForUpdate(Transaction&, const std::string& ride_id) = 0;

  virtual std::vector<model::RideRecord> ListRidesByStatus(Transaction&, RideStatus status) = 0;

  // Ride currently bound to the driver (assigned, arrived or in_progress).
  virtual std::optional<model::RideRecord> FindActiveRideForDriver(Transaction&, const std::string& driver_id) = 0;

  // Writes every mutable column of `record` only if the stored status equals
  // `expected`. NotFound if the ride does not exist, Conflict otherwise.
  virtual Result UpdateRideIfStatus(Transaction&, const model::RideRecord& record, RideStatus expected) = 0;

  // ---------------------------------------------------------------------
  // Ride status history (insert-only)
  // ---------------------------------------------------------------------

  // Assigns record.sequence.
  virtual Result AppendRideHistory(Transaction&, model::RideHistoryRecord& record) = 0;

  virtual std::vector<model::RideHistoryRecord> ListRideHistory(Transaction&, const std::string& ride_id) = 0;

  // ---------------------------------------------------------------------
  // Offers
  // ---------------------------------------------------------------------

  virtual Result InsertOffer(Transaction&, const model::OfferRecord&) = 0;

  virtual std::optional<model::OfferRecord> GetOffer(Transaction&, const std::string& offer_id) = 0;

  // Ordered by batch_number then created_at.
  virtual std::vector<model::OfferRecord> ListOffersForRide(Transaction&, const std::string& ride_id) = 0;

  // Pending offers with expires_at > now_ms.
  virtual std::vector<model::OfferRecord> ListPendingOffersForDriver(Transaction&, const std::string& driver_id, uint64_t now_ms) = 0;

  // 0 when the ride has no offers yet.
  virtual uint32_t MaxBatchNumber(Transaction&, const std::string& ride_id) = 0;

  // pending -> accepted, only while the offer is unexpired at now_ms and its
  // ride is still searching. Conflict when any predicate fails.
  virtual Result AcceptPendingOffer(Transaction&, const std::string& offer_id, uint64_t now_ms) = 0;

  // pending -> `to` for a single offer. Conflict if the offer is no longer pending.
  virtual Result ResolvePendingOffer(Transaction&, const std::string& offer_id, OfferStatus to, const std::string& reason, uint64_t now_ms) = 0;

  // pending -> `to` for every pending offer of the ride (optionally one batch).
  // The transitioned rows, with their new status, are appended to `resolved`.
  virtual Result ResolvePendingOffersForRide(Transaction&, const std::string& ride_id, std::optional<uint32_t> batch_number, OfferStatus to,
                                             uint64_t now_ms, std::vector<model::OfferRecord>& resolved) = 0;

  // ---------------------------------------------------------------------
  // Driver availability
  // ---------------------------------------------------------------------

  virtual Result UpsertDriverAvailability(Transaction&, const model::DriverAvailabilityRecord&) = 0;

  virtual std::optional<model::DriverAvailabilityRecord> GetDriverAvailability(Transaction&, const std::string& driver_id) = 0;

  // is_online && is_available && has_location && last_seen_at >= seen_since_ms
  virtual std::vector<model::DriverAvailabilityRecord> ListDispatchableDrivers(Transaction&, uint64_t seen_since_ms) = 0;

  // Heartbeat: location + last_seen_at. NotFound if the driver has no row.
  virtual Result TouchDriverLocation(Transaction&, const std::string& driver_id, double latitude, double longitude, uint64_t now_ms) = 0;

  // Presence mirror. NotFound if the driver has no row.
  virtual Result SetDriverOnline(Transaction&, const std::string& driver_id, bool online, uint64_t now_ms) = 0;

  // Busy/idle flag driven by the ride lifecycle. Resets available_since.
  virtual Result SetDriverAvailable(Transaction&, const std::string& driver_id, bool available, uint64_t now_ms) = 0;
};

} // namespace dispatch::db
