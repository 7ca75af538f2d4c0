#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace dispatch::db::sqlite {

using dispatch::db::ErrorCode;
using dispatch::db::Result;
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

// Finalizes on scope exit.
struct Statement {
  sqlite3_stmt* st = nullptr;

  Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
      st = nullptr;
    }
  }
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return st != nullptr;
  }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindNullableText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
    return;
  }
  BindText(st, idx, s);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

[[noreturn]] void ThrowRead(sqlite3* db, const std::string& what) {
  throw std::runtime_error("sqlite " + what + ": " + sqlite3_errmsg(db));
}

model::RideRecord ReadRide(sqlite3_stmt* st) {
  model::RideRecord r;
  r.id                    = ColText(st, 0);
  r.customer_id           = ColText(st, 1);
  r.pickup_lat            = ColDouble(st, 2);
  r.pickup_lon            = ColDouble(st, 3);
  r.pickup_address        = ColText(st, 4);
  r.dropoff_lat           = ColDouble(st, 5);
  r.dropoff_lon           = ColDouble(st, 6);
  r.dropoff_address       = ColText(st, 7);
  r.vehicle_type          = ColText(st, 8);
  r.service_tier          = ColText(st, 9);
  r.status                = static_cast<RideStatus>(ColI32(st, 10));
  r.estimated_fare        = ColDouble(st, 11);
  r.currency              = ColText(st, 12);
  r.estimated_distance_km = ColDouble(st, 13);
  r.assigned_driver_id    = ColText(st, 14);
  r.created_at_ms         = ColU64(st, 15);
  r.assigned_at_ms        = ColU64(st, 16);
  r.arrived_at_ms         = ColU64(st, 17);
  r.started_at_ms         = ColU64(st, 18);
  r.completed_at_ms       = ColU64(st, 19);
  r.cancelled_at_ms       = ColU64(st, 20);
  r.cancellation_reason   = ColText(st, 21);
  return r;
}

model::OfferRecord ReadOffer(sqlite3_stmt* st) {
  model::OfferRecord r;
  r.id              = ColText(st, 0);
  r.ride_id         = ColText(st, 1);
  r.driver_id       = ColText(st, 2);
  r.batch_number    = static_cast<uint32_t>(ColU64(st, 3));
  r.status          = static_cast<OfferStatus>(ColI32(st, 4));
  r.distance_km     = ColDouble(st, 5);
  r.eta_minutes     = static_cast<uint32_t>(ColU64(st, 6));
  r.reject_reason   = ColText(st, 7);
  r.created_at_ms   = ColU64(st, 8);
  r.expires_at_ms   = ColU64(st, 9);
  r.responded_at_ms = ColU64(st, 10);
  return r;
}

model::RideHistoryRecord ReadHistory(sqlite3_stmt* st) {
  model::RideHistoryRecord r;
  r.ride_id       = ColText(st, 0);
  r.sequence      = ColU64(st, 1);
  r.from_status   = static_cast<RideStatus>(ColI32(st, 2));
  r.to_status     = static_cast<RideStatus>(ColI32(st, 3));
  r.actor         = ColText(st, 4);
  r.reason        = ColText(st, 5);
  r.driver_id     = ColText(st, 6);
  r.created_at_ms = ColU64(st, 7);
  return r;
}

model::DriverAvailabilityRecord ReadDriver(sqlite3_stmt* st) {
  model::DriverAvailabilityRecord r;
  r.driver_id          = ColText(st, 0);
  r.is_online          = ColI32(st, 1) != 0;
  r.is_available       = ColI32(st, 2) != 0;
  r.has_location       = ColI32(st, 3) != 0;
  r.latitude           = ColDouble(st, 4);
  r.longitude          = ColDouble(st, 5);
  r.last_seen_at_ms    = ColU64(st, 6);
  r.vehicle_type       = ColText(st, 7);
  r.service_tier       = ColText(st, 8);
  r.rating             = ColDouble(st, 9);
  r.completed_rides    = static_cast<uint32_t>(ColU64(st, 10));
  r.available_since_ms = ColU64(st, 11);
  return r;
}

template <typename Row, typename Reader>
std::vector<Row> CollectRows(sqlite3* db, Statement& stmt, Reader reader, const char* what) {
  std::vector<Row> out;
  for (;;) {
    int rc = sqlite3_step(stmt.st);
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) ThrowRead(db, what);
    out.push_back(reader(stmt.st));
  }
  return out;
}

template <typename Row, typename Reader>
std::optional<Row> SingleRow(sqlite3* db, Statement& stmt, Reader reader, const char* what) {
  int rc = sqlite3_step(stmt.st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowRead(db, what);
  return reader(stmt.st);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::NoRowsChanged(sqlite3* db, const char* table, const char* key_column, const std::string& id) {
  Statement stmt(db, std::string("SELECT 1 FROM ") + table + " WHERE " + key_column + "=?;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(stmt.st, 1, id);
  int rc = sqlite3_step(stmt.st);
  if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, std::string(table) + " row " + id + " not found");
  if (rc != SQLITE_ROW) return Translate(db, rc);
  return Result::Err(ErrorCode::Conflict, std::string(table) + " row " + id + " did not match the expected state");
}

// ------------------------------------------------------------------
// Rides
// ------------------------------------------------------------------

Result SqliteRepository::InsertRide(Transaction& t, const model::RideRecord& r) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("INSERT INTO rides(") + kRideColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* st = stmt.st;
  BindText(st, 1, r.id);
  BindText(st, 2, r.customer_id);
  BindDouble(st, 3, r.pickup_lat);
  BindDouble(st, 4, r.pickup_lon);
  BindText(st, 5, r.pickup_address);
  BindDouble(st, 6, r.dropoff_lat);
  BindDouble(st, 7, r.dropoff_lon);
  BindText(st, 8, r.dropoff_address);
  BindText(st, 9, r.vehicle_type);
  BindText(st, 10, r.service_tier);
  BindI32(st, 11, static_cast<int>(r.status));
  BindDouble(st, 12, r.estimated_fare);
  BindText(st, 13, r.currency);
  BindDouble(st, 14, r.estimated_distance_km);
  BindNullableText(st, 15, r.assigned_driver_id);
  BindU64(st, 16, r.created_at_ms);
  BindU64(st, 17, r.assigned_at_ms);
  BindU64(st, 18, r.arrived_at_ms);
  BindU64(st, 19, r.started_at_ms);
  BindU64(st, 20, r.completed_at_ms);
  BindU64(st, 21, r.cancelled_at_ms);
  BindText(st, 22, r.cancellation_reason);

  return Translate(db, sqlite3_step(st));
}

std::optional<model::RideRecord> SqliteRepository::GetRide(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kRideColumns + " FROM rides WHERE id=?;");
  if (!stmt) ThrowRead(db, "get ride");

  BindText(stmt.st, 1, id);
  return SingleRow<model::RideRecord>(db, stmt, ReadRide, "get ride");
}

// BEGIN IMMEDIATE already holds the database write lock.
std::optional<model::RideRecord> SqliteRepository::GetRideForUpdate(Transaction& t, const std::string& id) {
  return GetRide(t, id);
}

std::vector<model::RideRecord> SqliteRepository::ListRidesByStatus(Transaction& t, RideStatus status) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kRideColumns + " FROM rides WHERE status=? ORDER BY created_at_ms, id;");
  if (!stmt) ThrowRead(db, "list rides");

  BindI32(stmt.st, 1, static_cast<int>(status));
  return CollectRows<model::RideRecord>(db, stmt, ReadRide, "list rides");
}

std::optional<model::RideRecord> SqliteRepository::FindActiveRideForDriver(Transaction& t, const std::string& driver_id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kRideColumns + " FROM rides WHERE assigned_driver_id=? AND status IN (?,?,?) LIMIT 1;");
  if (!stmt) ThrowRead(db, "find active ride");

  BindText(stmt.st, 1, driver_id);
  BindI32(stmt.st, 2, RIDE_STATUS_ASSIGNED);
  BindI32(stmt.st, 3, RIDE_STATUS_ARRIVED);
  BindI32(stmt.st, 4, RIDE_STATUS_IN_PROGRESS);
  return SingleRow<model::RideRecord>(db, stmt, ReadRide, "find active ride");
}

Result SqliteRepository::UpdateRideIfStatus(Transaction& t, const model::RideRecord& r, RideStatus expected) {
  auto* db = TX(t).Handle();

  Statement stmt(db,
                 "UPDATE rides SET status=?,estimated_fare=?,currency=?,estimated_distance_km=?,assigned_driver_id=?,assigned_at_ms=?,"
                 "arrived_at_ms=?,started_at_ms=?,completed_at_ms=?,cancelled_at_ms=?,cancellation_reason=? WHERE id=? AND status=?;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* st = stmt.st;
  BindI32(st, 1, static_cast<int>(r.status));
  BindDouble(st, 2, r.estimated_fare);
  BindText(st, 3, r.currency);
  BindDouble(st, 4, r.estimated_distance_km);
  BindNullableText(st, 5, r.assigned_driver_id);
  BindU64(st, 6, r.assigned_at_ms);
  BindU64(st, 7, r.arrived_at_ms);
  BindU64(st, 8, r.started_at_ms);
  BindU64(st, 9, r.completed_at_ms);
  BindU64(st, 10, r.cancelled_at_ms);
  BindText(st, 11, r.cancellation_reason);
  BindText(st, 12, r.id);
  BindI32(st, 13, static_cast<int>(expected));

  auto result = Translate(db, sqlite3_step(st));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return NoRowsChanged(db, "rides", "id", r.id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result SqliteRepository::AppendRideHistory(Transaction& t, model::RideHistoryRecord& r) {
  auto* db = TX(t).Handle();

  Statement next(db, "SELECT COALESCE(MAX(sequence),0)+1 FROM ride_status_history WHERE ride_id=?;");
  if (!next) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(next.st, 1, r.ride_id);
  int rc = sqlite3_step(next.st);
  if (rc != SQLITE_ROW) return Translate(db, rc);
  const uint64_t sequence = ColU64(next.st, 0);

  Statement stmt(db, std::string("INSERT INTO ride_status_history(") + kHistoryColumns + ") VALUES(?,?,?,?,?,?,?,?);");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(stmt.st, 1, r.ride_id);
  BindU64(stmt.st, 2, sequence);
  BindI32(stmt.st, 3, static_cast<int>(r.from_status));
  BindI32(stmt.st, 4, static_cast<int>(r.to_status));
  BindText(stmt.st, 5, r.actor);
  BindText(stmt.st, 6, r.reason);
  BindText(stmt.st, 7, r.driver_id);
  BindU64(stmt.st, 8, r.created_at_ms);

  auto result = Translate(db, sqlite3_step(stmt.st));
  if (result) r.sequence = sequence;
  return result;
}

std::vector<model::RideHistoryRecord> SqliteRepository::ListRideHistory(Transaction& t, const std::string& ride_id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kHistoryColumns + " FROM ride_status_history WHERE ride_id=? ORDER BY sequence;");
  if (!stmt) ThrowRead(db, "list ride history");

  BindText(stmt.st, 1, ride_id);
  return CollectRows<model::RideHistoryRecord>(db, stmt, ReadHistory, "list ride history");
}

// ------------------------------------------------------------------
// Offers
// ------------------------------------------------------------------

Result SqliteRepository::InsertOffer(Transaction& t, const model::OfferRecord& r) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("INSERT INTO ride_offers(") + kOfferColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* st = stmt.st;
  BindText(st, 1, r.id);
  BindText(st, 2, r.ride_id);
  BindText(st, 3, r.driver_id);
  BindU64(st, 4, r.batch_number);
  BindI32(st, 5, static_cast<int>(r.status));
  BindDouble(st, 6, r.distance_km);
  BindU64(st, 7, r.eta_minutes);
  BindText(st, 8, r.reject_reason);
  BindU64(st, 9, r.created_at_ms);
  BindU64(st, 10, r.expires_at_ms);
  BindU64(st, 11, r.responded_at_ms);

  return Translate(db, sqlite3_step(st));
}

std::optional<model::OfferRecord> SqliteRepository::GetOffer(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kOfferColumns + " FROM ride_offers WHERE id=?;");
  if (!stmt) ThrowRead(db, "get offer");

  BindText(stmt.st, 1, id);
  return SingleRow<model::OfferRecord>(db, stmt, ReadOffer, "get offer");
}

std::vector<model::OfferRecord> SqliteRepository::ListOffersForRide(Transaction& t, const std::string& ride_id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kOfferColumns + " FROM ride_offers WHERE ride_id=? ORDER BY batch_number, created_at_ms, rowid;");
  if (!stmt) ThrowRead(db, "list offers");

  BindText(stmt.st, 1, ride_id);
  return CollectRows<model::OfferRecord>(db, stmt, ReadOffer, "list offers");
}

std::vector<model::OfferRecord> SqliteRepository::ListPendingOffersForDriver(Transaction& t, const std::string& driver_id, uint64_t now_ms) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kOfferColumns +
                         " FROM ride_offers WHERE driver_id=? AND status=? AND expires_at_ms>? ORDER BY created_at_ms, rowid;");
  if (!stmt) ThrowRead(db, "list pending offers");

  BindText(stmt.st, 1, driver_id);
  BindI32(stmt.st, 2, OFFER_STATUS_PENDING);
  BindU64(stmt.st, 3, now_ms);
  return CollectRows<model::OfferRecord>(db, stmt, ReadOffer, "list pending offers");
}

uint32_t SqliteRepository::MaxBatchNumber(Transaction& t, const std::string& ride_id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, "SELECT COALESCE(MAX(batch_number),0) FROM ride_offers WHERE ride_id=?;");
  if (!stmt) ThrowRead(db, "max batch number");

  BindText(stmt.st, 1, ride_id);
  if (sqlite3_step(stmt.st) != SQLITE_ROW) ThrowRead(db, "max batch number");
  return static_cast<uint32_t>(ColU64(stmt.st, 0));
}

Result SqliteRepository::AcceptPendingOffer(Transaction& t, const std::string& offer_id, uint64_t now_ms) {
  auto* db = TX(t).Handle();

  Statement stmt(db,
                 "UPDATE ride_offers SET status=?,responded_at_ms=? "
                 "WHERE id=? AND status=? AND expires_at_ms>? "
                 "AND EXISTS (SELECT 1 FROM rides r WHERE r.id=ride_offers.ride_id AND r.status=?);");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(stmt.st, 1, OFFER_STATUS_ACCEPTED);
  BindU64(stmt.st, 2, now_ms);
  BindText(stmt.st, 3, offer_id);
  BindI32(stmt.st, 4, OFFER_STATUS_PENDING);
  BindU64(stmt.st, 5, now_ms);
  BindI32(stmt.st, 6, RIDE_STATUS_SEARCHING);

  auto result = Translate(db, sqlite3_step(stmt.st));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return NoRowsChanged(db, "ride_offers", "id", offer_id);
  return Result::Ok();
}

Result SqliteRepository::ResolvePendingOffer(Transaction& t, const std::string& offer_id, OfferStatus to, const std::string& reason, uint64_t now_ms) {
  auto* db = TX(t).Handle();

  Statement stmt(db, "UPDATE ride_offers SET status=?,responded_at_ms=?,reject_reason=? WHERE id=? AND status=?;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(stmt.st, 1, static_cast<int>(to));
  BindU64(stmt.st, 2, now_ms);
  BindText(stmt.st, 3, reason);
  BindText(stmt.st, 4, offer_id);
  BindI32(stmt.st, 5, OFFER_STATUS_PENDING);

  auto result = Translate(db, sqlite3_step(stmt.st));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return NoRowsChanged(db, "ride_offers", "id", offer_id);
  return Result::Ok();
}

Result SqliteRepository::ResolvePendingOffersForRide(Transaction& t, const std::string& ride_id, std::optional<uint32_t> batch_number, OfferStatus to,
                                                     uint64_t now_ms, std::vector<model::OfferRecord>& resolved) {
  auto* db = TX(t).Handle();

  // The write lock is held since BEGIN IMMEDIATE, so the SELECT and UPDATE see the same rows.
  const std::string predicate = batch_number.has_value() ? " WHERE ride_id=?1 AND status=?2 AND batch_number=?3" : " WHERE ride_id=?1 AND status=?2";

  Statement select(db, std::string("SELECT ") + kOfferColumns + " FROM ride_offers" + predicate + " ORDER BY created_at_ms, rowid;");
  if (!select) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(select.st, 1, ride_id);
  BindI32(select.st, 2, OFFER_STATUS_PENDING);
  if (batch_number.has_value()) BindU64(select.st, 3, *batch_number);

  std::vector<model::OfferRecord> pending;
  for (;;) {
    int rc = sqlite3_step(select.st);
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) return Translate(db, rc);
    pending.push_back(ReadOffer(select.st));
  }
  if (pending.empty()) return Result::Ok();

  Statement update(db, "UPDATE ride_offers SET status=?4,responded_at_ms=?5" + predicate + ";");
  if (!update) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(update.st, 1, ride_id);
  BindI32(update.st, 2, OFFER_STATUS_PENDING);
  if (batch_number.has_value()) BindU64(update.st, 3, *batch_number);
  BindI32(update.st, 4, static_cast<int>(to));
  BindU64(update.st, 5, now_ms);

  auto result = Translate(db, sqlite3_step(update.st));
  if (!result) return result;

  for (auto& offer : pending) {
    offer.status          = to;
    offer.responded_at_ms = now_ms;
    resolved.push_back(std::move(offer));
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Drivers
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDriverAvailability(Transaction& t, const model::DriverAvailabilityRecord& r) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("INSERT INTO driver_availability(") + kDriverColumns +
                         ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT(driver_id) DO UPDATE SET "
                         "is_online=excluded.is_online,is_available=excluded.is_available,has_location=excluded.has_location,"
                         "latitude=excluded.latitude,longitude=excluded.longitude,last_seen_at_ms=excluded.last_seen_at_ms,"
                         "vehicle_type=excluded.vehicle_type,service_tier=excluded.service_tier,rating=excluded.rating,"
                         "completed_rides=excluded.completed_rides,available_since_ms=excluded.available_since_ms;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  auto* st = stmt.st;
  BindText(st, 1, r.driver_id);
  BindI32(st, 2, r.is_online ? 1 : 0);
  BindI32(st, 3, r.is_available ? 1 : 0);
  BindI32(st, 4, r.has_location ? 1 : 0);
  BindDouble(st, 5, r.latitude);
  BindDouble(st, 6, r.longitude);
  BindU64(st, 7, r.last_seen_at_ms);
  BindText(st, 8, r.vehicle_type);
  BindText(st, 9, r.service_tier);
  BindDouble(st, 10, r.rating);
  BindU64(st, 11, r.completed_rides);
  BindU64(st, 12, r.available_since_ms);

  return Translate(db, sqlite3_step(st));
}

std::optional<model::DriverAvailabilityRecord> SqliteRepository::GetDriverAvailability(Transaction& t, const std::string& driver_id) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kDriverColumns + " FROM driver_availability WHERE driver_id=?;");
  if (!stmt) ThrowRead(db, "get driver availability");

  BindText(stmt.st, 1, driver_id);
  return SingleRow<model::DriverAvailabilityRecord>(db, stmt, ReadDriver, "get driver availability");
}

std::vector<model::DriverAvailabilityRecord> SqliteRepository::ListDispatchableDrivers(Transaction& t, uint64_t seen_since_ms) {
  auto* db = TX(t).Handle();

  Statement stmt(db, std::string("SELECT ") + kDriverColumns +
                         " FROM driver_availability WHERE is_online=1 AND is_available=1 AND has_location=1 AND last_seen_at_ms>=? "
                         "ORDER BY driver_id;");
  if (!stmt) ThrowRead(db, "list dispatchable drivers");

  BindU64(stmt.st, 1, seen_since_ms);
  return CollectRows<model::DriverAvailabilityRecord>(db, stmt, ReadDriver, "list dispatchable drivers");
}

Result SqliteRepository::TouchDriverLocation(Transaction& t, const std::string& driver_id, double latitude, double longitude, uint64_t now_ms) {
  auto* db = TX(t).Handle();

  Statement stmt(db, "UPDATE driver_availability SET has_location=1,latitude=?,longitude=?,last_seen_at_ms=? WHERE driver_id=?;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindDouble(stmt.st, 1, latitude);
  BindDouble(stmt.st, 2, longitude);
  BindU64(stmt.st, 3, now_ms);
  BindText(stmt.st, 4, driver_id);

  auto result = Translate(db, sqlite3_step(stmt.st));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "driver " + driver_id + " has no availability record");
  return Result::Ok();
}

Result SqliteRepository::SetDriverOnline(Transaction& t, const std::string& driver_id, bool online, uint64_t now_ms) {
  auto* db = TX(t).Handle();

  Statement stmt(db, "UPDATE driver_availability SET is_online=?,last_seen_at_ms=? WHERE driver_id=?;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(stmt.st, 1, online ? 1 : 0);
  BindU64(stmt.st, 2, now_ms);
  BindText(stmt.st, 3, driver_id);

  auto result = Translate(db, sqlite3_step(stmt.st));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "driver " + driver_id + " has no availability record");
  return Result::Ok();
}

Result SqliteRepository::SetDriverAvailable(Transaction& t, const std::string& driver_id, bool available, uint64_t now_ms) {
  auto* db = TX(t).Handle();

  Statement stmt(db, "UPDATE driver_availability SET is_available=?,available_since_ms=? WHERE driver_id=?;");
  if (!stmt) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(stmt.st, 1, available ? 1 : 0);
  BindU64(stmt.st, 2, available ? now_ms : 0);
  BindText(stmt.st, 3, driver_id);

  auto result = Translate(db, sqlite3_step(stmt.st));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "driver " + driver_id + " has no availability record");
  return Result::Ok();
}

} // namespace dispatch::db::sqlite
