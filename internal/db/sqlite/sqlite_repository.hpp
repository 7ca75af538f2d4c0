#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace dispatch::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertRide(Transaction&, const model::RideRecord&) override;
  std::optional<model::RideRecord> GetRide(Transaction&, const std::string&) override;
  std::optional<model::RideRecord> GetRideForUpdate(Transaction&, const std::string&) override;
  std::vector<model::RideRecord>   ListRidesByStatus(Transaction&, RideStatus) override;
  std::optional<model::RideRecord> FindActiveRideForDriver(Transaction&, const std::string&) override;
  Result                           UpdateRideIfStatus(Transaction&, const model::RideRecord&, RideStatus expected) override;

  Result                                 AppendRideHistory(Transaction&, model::RideHistoryRecord&) override;
  std::vector<model::RideHistoryRecord> ListRideHistory(Transaction&, const std::string&) override;

  Result                            InsertOffer(Transaction&, const model::OfferRecord&) override;
  std::optional<model::OfferRecord> GetOffer(Transaction&, const std::string&) override;
  std::vector<model::OfferRecord>   ListOffersForRide(Transaction&, const std::string&) override;
  std::vector<model::OfferRecord>   ListPendingOffersForDriver(Transaction&, const std::string&, uint64_t now_ms) override;
  uint32_t                          MaxBatchNumber(Transaction&, const std::string&) override;
  Result                            AcceptPendingOffer(Transaction&, const std::string&, uint64_t now_ms) override;
  Result ResolvePendingOffer(Transaction&, const std::string&, OfferStatus to, const std::string& reason, uint64_t now_ms) override;
  Result ResolvePendingOffersForRide(Transaction&, const std::string& ride_id, std::optional<uint32_t> batch_number, OfferStatus to,
                                     uint64_t now_ms, std::vector<model::OfferRecord>& resolved) override;

  Result                                         UpsertDriverAvailability(Transaction&, const model::DriverAvailabilityRecord&) override;
  std::optional<model::DriverAvailabilityRecord> GetDriverAvailability(Transaction&, const std::string&) override;
  std::vector<model::DriverAvailabilityRecord>   ListDispatchableDrivers(Transaction&, uint64_t seen_since_ms) override;
  Result TouchDriverLocation(Transaction&, const std::string&, double latitude, double longitude, uint64_t now_ms) override;
  Result SetDriverOnline(Transaction&, const std::string&, bool online, uint64_t now_ms) override;
  Result SetDriverAvailable(Transaction&, const std::string&, bool available, uint64_t now_ms) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  // NotFound when no row with `id` exists in `table`, Conflict otherwise.
  static Result NoRowsChanged(sqlite3* db, const char* table, const char* key_column, const std::string& id);
};

} // namespace dispatch::db::sqlite
