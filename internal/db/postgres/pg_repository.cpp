#include "pg_repository.hpp"

#include <algorithm>

namespace dispatch::db::postgres {

using namespace dispatch::engine::core::v1;

namespace {

constexpr const char* kRideColumns =
    "id,customer_id,pickup_lat,pickup_lon,pickup_address,dropoff_lat,dropoff_lon,dropoff_address,vehicle_type,service_tier,"
    "status,estimated_fare,currency,estimated_distance_km,assigned_driver_id,created_at_ms,assigned_at_ms,arrived_at_ms,"
    "started_at_ms,completed_at_ms,cancelled_at_ms,cancellation_reason";

constexpr const char* kOfferColumns =
    "id,ride_id,driver_id,batch_number,status,distance_km,eta_minutes,reject_reason,created_at_ms,expires_at_ms,responded_at_ms";

constexpr const char* kHistoryColumns = "ride_id,sequence,from_status,to_status,actor,reason,driver_id,created_at_ms";

constexpr const char* kDriverColumns =
    "driver_id,is_online,is_available,has_location,latitude,longitude,last_seen_at_ms,vehicle_type,service_tier,rating,"
    "completed_rides,available_since_ms";

int64_t Ms(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::optional<std::string> Nullable(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

uint64_t U64(const pqxx::field& f) {
  return static_cast<uint64_t>(f.as<int64_t>());
}

model::RideRecord ReadRide(const pqxx::row& row) {
  model::RideRecord r;
  r.id                    = Text(row[0]);
  r.customer_id           = Text(row[1]);
  r.pickup_lat            = row[2].as<double>();
  r.pickup_lon            = row[3].as<double>();
  r.pickup_address        = Text(row[4]);
  r.dropoff_lat           = row[5].as<double>();
  r.dropoff_lon           = row[6].as<double>();
  r.dropoff_address       = Text(row[7]);
  r.vehicle_type          = Text(row[8]);
  r.service_tier          = Text(row[9]);
  r.status                = static_cast<RideStatus>(row[10].as<int>());
  r.estimated_fare        = row[11].as<double>();
  r.currency              = Text(row[12]);
  r.estimated_distance_km = row[13].as<double>();
  r.assigned_driver_id    = Text(row[14]);
  r.created_at_ms         = U64(row[15]);
  r.assigned_at_ms        = U64(row[16]);
  r.arrived_at_ms         = U64(row[17]);
  r.started_at_ms         = U64(row[18]);
  r.completed_at_ms       = U64(row[19]);
  r.cancelled_at_ms       = U64(row[20]);
  r.cancellation_reason   = Text(row[21]);
  return r;
}

model::OfferRecord ReadOffer(const pqxx::row& row) {
  model::OfferRecord r;
  r.id              = Text(row[0]);
  r.ride_id         = Text(row[1]);
  r.driver_id       = Text(row[2]);
  r.batch_number    = static_cast<uint32_t>(row[3].as<int64_t>());
  r.status          = static_cast<OfferStatus>(row[4].as<int>());
  r.distance_km     = row[5].as<double>();
  r.eta_minutes     = static_cast<uint32_t>(row[6].as<int64_t>());
  r.reject_reason   = Text(row[7]);
  r.created_at_ms   = U64(row[8]);
  r.expires_at_ms   = U64(row[9]);
  r.responded_at_ms = U64(row[10]);
  return r;
}

model::RideHistoryRecord ReadHistory(const pqxx::row& row) {
  model::RideHistoryRecord r;
  r.ride_id       = Text(row[0]);
  r.sequence      = U64(row[1]);
  r.from_status   = static_cast<RideStatus>(row[2].as<int>());
  r.to_status     = static_cast<RideStatus>(row[3].as<int>());
  r.actor         = Text(row[4]);
  r.reason        = Text(row[5]);
  r.driver_id     = Text(row[6]);
  r.created_at_ms = U64(row[7]);
  return r;
}

model::DriverAvailabilityRecord ReadDriver(const pqxx::row& row) {
  model::DriverAvailabilityRecord r;
  r.driver_id          = Text(row[0]);
  r.is_online          = row[1].as<bool>();
  r.is_available       = row[2].as<bool>();
  r.has_location       = row[3].as<bool>();
  r.latitude           = row[4].as<double>();
  r.longitude          = row[5].as<double>();
  r.last_seen_at_ms    = U64(row[6]);
  r.vehicle_type       = Text(row[7]);
  r.service_tier       = Text(row[8]);
  r.rating             = row[9].as<double>();
  r.completed_rides    = static_cast<uint32_t>(row[10].as<int64_t>());
  r.available_since_ms = U64(row[11]);
  return r;
}

template <typename Row, typename Reader>
std::vector<Row> ReadAll(const pqxx::result& res, Reader reader) {
  std::vector<Row> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(reader(row));
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  // serialization_failure and deadlock_detected both derive from transaction_rollback.
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::NoRowsChanged(pqxx::work& w, const char* table, const char* key_column, const std::string& id) {
  auto res = w.exec_params(std::string("SELECT 1 FROM ") + table + " WHERE " + key_column + "=$1;", id);
  if (res.empty()) return Result::Err(ErrorCode::NotFound, std::string(table) + " row " + id + " not found");
  return Result::Err(ErrorCode::Conflict, std::string(table) + " row " + id + " did not match the expected state");
}

// ------------------------------------------------------------------
// Rides
// ------------------------------------------------------------------

Result PgRepository::InsertRide(Transaction& t, const model::RideRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_ride", r.id, r.customer_id, r.pickup_lat, r.pickup_lon, r.pickup_address, r.dropoff_lat, r.dropoff_lon,
                               r.dropoff_address, r.vehicle_type, r.service_tier, static_cast<int>(r.status), r.estimated_fare, r.currency,
                               r.estimated_distance_km, Nullable(r.assigned_driver_id), Ms(r.created_at_ms), Ms(r.assigned_at_ms),
                               Ms(r.arrived_at_ms), Ms(r.started_at_ms), Ms(r.completed_at_ms), Ms(r.cancelled_at_ms), r.cancellation_reason);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RideRecord> PgRepository::GetRide(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_ride", id);
  if (res.empty()) return std::nullopt;
  return ReadRide(res[0]);
}

std::optional<model::RideRecord> PgRepository::GetRideForUpdate(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_ride_for_update", id);
  if (res.empty()) return std::nullopt;
  return ReadRide(res[0]);
}

std::vector<model::RideRecord> PgRepository::ListRidesByStatus(Transaction& t, RideStatus status) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRideColumns + " FROM rides WHERE status=$1 ORDER BY created_at_ms, id;",
                                      static_cast<int>(status));
  return ReadAll<model::RideRecord>(res, ReadRide);
}

std::optional<model::RideRecord> PgRepository::FindActiveRideForDriver(Transaction& t, const std::string& driver_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRideColumns + " FROM rides WHERE assigned_driver_id=$1 AND status IN (2,3,4) LIMIT 1;",
                                      driver_id);
  if (res.empty()) return std::nullopt;
  return ReadRide(res[0]);
}

Result PgRepository::UpdateRideIfStatus(Transaction& t, const model::RideRecord& r, RideStatus expected) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_prepared("update_ride_if_status", r.id, static_cast<int>(r.status), r.estimated_fare, r.currency, r.estimated_distance_km,
                                Nullable(r.assigned_driver_id), Ms(r.assigned_at_ms), Ms(r.arrived_at_ms), Ms(r.started_at_ms),
                                Ms(r.completed_at_ms), Ms(r.cancelled_at_ms), r.cancellation_reason, static_cast<int>(expected));
    if (res.affected_rows() == 0) return NoRowsChanged(w, "rides", "id", r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result PgRepository::AppendRideHistory(Transaction& t, model::RideHistoryRecord& r) {
  try {
    auto& w = TX(t).Work();
    // Row lock on the ride orders concurrent appenders.
    w.exec_params("SELECT 1 FROM rides WHERE id=$1 FOR UPDATE;", r.ride_id);
    auto res = w.exec_params(
        std::string("INSERT INTO ride_status_history(") + kHistoryColumns +
            ") SELECT $1, COALESCE(MAX(sequence),0)+1, $2,$3,$4,$5,$6,$7 FROM ride_status_history WHERE ride_id=$1 RETURNING sequence;",
        r.ride_id, static_cast<int>(r.from_status), static_cast<int>(r.to_status), r.actor, r.reason, r.driver_id, Ms(r.created_at_ms));
    r.sequence = U64(res[0][0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RideHistoryRecord> PgRepository::ListRideHistory(Transaction& t, const std::string& ride_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kHistoryColumns + " FROM ride_status_history WHERE ride_id=$1 ORDER BY sequence;",
                                      ride_id);
  return ReadAll<model::RideHistoryRecord>(res, ReadHistory);
}

// ------------------------------------------------------------------
// Offers
// ------------------------------------------------------------------

Result PgRepository::InsertOffer(Transaction& t, const model::OfferRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_offer", r.id, r.ride_id, r.driver_id, static_cast<int64_t>(r.batch_number), static_cast<int>(r.status),
                               r.distance_km, static_cast<int64_t>(r.eta_minutes), r.reject_reason, Ms(r.created_at_ms), Ms(r.expires_at_ms),
                               Ms(r.responded_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::OfferRecord> PgRepository::GetOffer(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_offer", id);
  if (res.empty()) return std::nullopt;
  return ReadOffer(res[0]);
}

std::vector<model::OfferRecord> PgRepository::ListOffersForRide(Transaction& t, const std::string& ride_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kOfferColumns + " FROM ride_offers WHERE ride_id=$1 ORDER BY batch_number, created_at_ms, id;", ride_id);
  return ReadAll<model::OfferRecord>(res, ReadOffer);
}

std::vector<model::OfferRecord> PgRepository::ListPendingOffersForDriver(Transaction& t, const std::string& driver_id, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kOfferColumns +
                                          " FROM ride_offers WHERE driver_id=$1 AND status=1 AND expires_at_ms>$2 ORDER BY created_at_ms, id;",
                                      driver_id, Ms(now_ms));
  return ReadAll<model::OfferRecord>(res, ReadOffer);
}

uint32_t PgRepository::MaxBatchNumber(Transaction& t, const std::string& ride_id) {
  auto res = TX(t).Work().exec_params("SELECT COALESCE(MAX(batch_number),0) FROM ride_offers WHERE ride_id=$1;", ride_id);
  return static_cast<uint32_t>(res[0][0].as<int64_t>());
}

Result PgRepository::AcceptPendingOffer(Transaction& t, const std::string& offer_id, uint64_t now_ms) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_prepared("accept_pending_offer", offer_id, Ms(now_ms));
    if (res.affected_rows() == 0) return NoRowsChanged(w, "ride_offers", "id", offer_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ResolvePendingOffer(Transaction& t, const std::string& offer_id, OfferStatus to, const std::string& reason, uint64_t now_ms) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params("UPDATE ride_offers SET status=$2,responded_at_ms=$3,reject_reason=$4 WHERE id=$1 AND status=1;", offer_id,
                              static_cast<int>(to), Ms(now_ms), reason);
    if (res.affected_rows() == 0) return NoRowsChanged(w, "ride_offers", "id", offer_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ResolvePendingOffersForRide(Transaction& t, const std::string& ride_id, std::optional<uint32_t> batch_number, OfferStatus to,
                                                 uint64_t now_ms, std::vector<model::OfferRecord>& resolved) {
  try {
    std::optional<int64_t> batch;
    if (batch_number.has_value()) batch = static_cast<int64_t>(*batch_number);

    auto res = TX(t).Work().exec_params(std::string("UPDATE ride_offers SET status=$2,responded_at_ms=$3 "
                                                    "WHERE ride_id=$1 AND status=1 AND ($4::BIGINT IS NULL OR batch_number=$4) RETURNING ") +
                                            kOfferColumns + ";",
                                        ride_id, static_cast<int>(to), Ms(now_ms), batch);
    auto rows = ReadAll<model::OfferRecord>(res, ReadOffer);
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
      return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
    });
    for (auto& offer : rows) resolved.push_back(std::move(offer));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Drivers
// ------------------------------------------------------------------

Result PgRepository::UpsertDriverAvailability(Transaction& t, const model::DriverAvailabilityRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO driver_availability(") + kDriverColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12) ON CONFLICT(driver_id) DO UPDATE SET "
                                 "is_online=EXCLUDED.is_online,is_available=EXCLUDED.is_available,has_location=EXCLUDED.has_location,"
                                 "latitude=EXCLUDED.latitude,longitude=EXCLUDED.longitude,last_seen_at_ms=EXCLUDED.last_seen_at_ms,"
                                 "vehicle_type=EXCLUDED.vehicle_type,service_tier=EXCLUDED.service_tier,rating=EXCLUDED.rating,"
                                 "completed_rides=EXCLUDED.completed_rides,available_since_ms=EXCLUDED.available_since_ms;",
                             r.driver_id, r.is_online, r.is_available, r.has_location, r.latitude, r.longitude, Ms(r.last_seen_at_ms), r.vehicle_type,
                             r.service_tier, r.rating, static_cast<int64_t>(r.completed_rides), Ms(r.available_since_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DriverAvailabilityRecord> PgRepository::GetDriverAvailability(Transaction& t, const std::string& driver_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kDriverColumns + " FROM driver_availability WHERE driver_id=$1;", driver_id);
  if (res.empty()) return std::nullopt;
  return ReadDriver(res[0]);
}

std::vector<model::DriverAvailabilityRecord> PgRepository::ListDispatchableDrivers(Transaction& t, uint64_t seen_since_ms) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kDriverColumns +
                                          " FROM driver_availability WHERE is_online AND is_available AND has_location AND last_seen_at_ms>=$1 "
                                          "ORDER BY driver_id;",
                                      Ms(seen_since_ms));
  return ReadAll<model::DriverAvailabilityRecord>(res, ReadDriver);
}

Result PgRepository::TouchDriverLocation(Transaction& t, const std::string& driver_id, double latitude, double longitude, uint64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE driver_availability SET has_location=TRUE,latitude=$2,longitude=$3,last_seen_at_ms=$4 WHERE driver_id=$1;", driver_id, latitude,
        longitude, Ms(now_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "driver " + driver_id + " has no availability record");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetDriverOnline(Transaction& t, const std::string& driver_id, bool online, uint64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE driver_availability SET is_online=$2,last_seen_at_ms=$3 WHERE driver_id=$1;", driver_id, online,
                                        Ms(now_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "driver " + driver_id + " has no availability record");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetDriverAvailable(Transaction& t, const std::string& driver_id, bool available, uint64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE driver_availability SET is_available=$2,available_since_ms=$3 WHERE driver_id=$1;", driver_id,
                                        available, Ms(available ? now_ms : 0));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "driver " + driver_id + " has no availability record");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace dispatch::db::postgres
