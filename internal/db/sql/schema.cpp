#include "schema.hpp"

namespace dispatch::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
}

// Status columns hold the proto enum numbers (RideStatus / OfferStatus).
// assigned_driver_id is bound iff status is assigned(2), arrived(3), in_progress(4) or completed(5).

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS rides ("
      "id TEXT PRIMARY KEY, customer_id TEXT NOT NULL, "
      "pickup_lat REAL NOT NULL, pickup_lon REAL NOT NULL, pickup_address TEXT, "
      "dropoff_lat REAL NOT NULL, dropoff_lon REAL NOT NULL, dropoff_address TEXT, "
      "vehicle_type TEXT, service_tier TEXT, status INTEGER NOT NULL, "
      "estimated_fare REAL NOT NULL DEFAULT 0, currency TEXT, estimated_distance_km REAL NOT NULL DEFAULT 0, "
      "assigned_driver_id TEXT, created_at_ms INTEGER NOT NULL, assigned_at_ms INTEGER NOT NULL DEFAULT 0, "
      "arrived_at_ms INTEGER NOT NULL DEFAULT 0, started_at_ms INTEGER NOT NULL DEFAULT 0, completed_at_ms INTEGER NOT NULL DEFAULT 0, "
      "cancelled_at_ms INTEGER NOT NULL DEFAULT 0, cancellation_reason TEXT, "
      "CHECK ((assigned_driver_id IS NOT NULL) = (status IN (2,3,4,5))));",
      "CREATE INDEX IF NOT EXISTS rides_status_idx ON rides(status);",
      "CREATE INDEX IF NOT EXISTS rides_driver_idx ON rides(assigned_driver_id);",

      "CREATE TABLE IF NOT EXISTS ride_offers ("
      "id TEXT PRIMARY KEY, ride_id TEXT NOT NULL REFERENCES rides(id), driver_id TEXT NOT NULL, "
      "batch_number INTEGER NOT NULL, status INTEGER NOT NULL, distance_km REAL NOT NULL DEFAULT 0, "
      "eta_minutes INTEGER NOT NULL DEFAULT 0, reject_reason TEXT, created_at_ms INTEGER NOT NULL, "
      "expires_at_ms INTEGER NOT NULL, responded_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE UNIQUE INDEX IF NOT EXISTS ride_offers_one_accepted ON ride_offers(ride_id) WHERE status = 2;",
      "CREATE INDEX IF NOT EXISTS ride_offers_ride_idx ON ride_offers(ride_id, batch_number);",
      "CREATE INDEX IF NOT EXISTS ride_offers_driver_idx ON ride_offers(driver_id, status);",

      "CREATE TABLE IF NOT EXISTS ride_status_history ("
      "ride_id TEXT NOT NULL REFERENCES rides(id), sequence INTEGER NOT NULL, from_status INTEGER NOT NULL, "
      "to_status INTEGER NOT NULL, actor TEXT, reason TEXT, driver_id TEXT, created_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY (ride_id, sequence));",

      "CREATE TABLE IF NOT EXISTS driver_availability ("
      "driver_id TEXT PRIMARY KEY, is_online INTEGER NOT NULL DEFAULT 0, is_available INTEGER NOT NULL DEFAULT 0, "
      "has_location INTEGER NOT NULL DEFAULT 0, latitude REAL NOT NULL DEFAULT 0, longitude REAL NOT NULL DEFAULT 0, "
      "last_seen_at_ms INTEGER NOT NULL DEFAULT 0, vehicle_type TEXT, service_tier TEXT, rating REAL NOT NULL DEFAULT 0, "
      "completed_rides INTEGER NOT NULL DEFAULT 0, available_since_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS driver_availability_dispatch_idx ON driver_availability(is_online, is_available);"};
  return kStatements;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS rides ("
      "id TEXT PRIMARY KEY, customer_id TEXT NOT NULL, "
      "pickup_lat DOUBLE PRECISION NOT NULL, pickup_lon DOUBLE PRECISION NOT NULL, pickup_address TEXT, "
      "dropoff_lat DOUBLE PRECISION NOT NULL, dropoff_lon DOUBLE PRECISION NOT NULL, dropoff_address TEXT, "
      "vehicle_type TEXT, service_tier TEXT, status SMALLINT NOT NULL, "
      "estimated_fare DOUBLE PRECISION NOT NULL DEFAULT 0, currency TEXT, estimated_distance_km DOUBLE PRECISION NOT NULL DEFAULT 0, "
      "assigned_driver_id TEXT, created_at_ms BIGINT NOT NULL, assigned_at_ms BIGINT NOT NULL DEFAULT 0, "
      "arrived_at_ms BIGINT NOT NULL DEFAULT 0, started_at_ms BIGINT NOT NULL DEFAULT 0, completed_at_ms BIGINT NOT NULL DEFAULT 0, "
      "cancelled_at_ms BIGINT NOT NULL DEFAULT 0, cancellation_reason TEXT, "
      "CHECK ((assigned_driver_id IS NOT NULL) = (status IN (2,3,4,5))));",
      "CREATE INDEX IF NOT EXISTS rides_status_idx ON rides(status);",
      "CREATE INDEX IF NOT EXISTS rides_driver_idx ON rides(assigned_driver_id);",

      "CREATE TABLE IF NOT EXISTS ride_offers ("
      "id TEXT PRIMARY KEY, ride_id TEXT NOT NULL REFERENCES rides(id), driver_id TEXT NOT NULL, "
      "batch_number INTEGER NOT NULL, status SMALLINT NOT NULL, distance_km DOUBLE PRECISION NOT NULL DEFAULT 0, "
      "eta_minutes INTEGER NOT NULL DEFAULT 0, reject_reason TEXT, created_at_ms BIGINT NOT NULL, "
      "expires_at_ms BIGINT NOT NULL, responded_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE UNIQUE INDEX IF NOT EXISTS ride_offers_one_accepted ON ride_offers(ride_id) WHERE status = 2;",
      "CREATE INDEX IF NOT EXISTS ride_offers_ride_idx ON ride_offers(ride_id, batch_number);",
      "CREATE INDEX IF NOT EXISTS ride_offers_driver_idx ON ride_offers(driver_id, status);",

      "CREATE TABLE IF NOT EXISTS ride_status_history ("
      "ride_id TEXT NOT NULL REFERENCES rides(id), sequence BIGINT NOT NULL, from_status SMALLINT NOT NULL, "
      "to_status SMALLINT NOT NULL, actor TEXT, reason TEXT, driver_id TEXT, created_at_ms BIGINT NOT NULL, "
      "PRIMARY KEY (ride_id, sequence));",

      "CREATE TABLE IF NOT EXISTS driver_availability ("
      "driver_id TEXT PRIMARY KEY, is_online BOOLEAN NOT NULL DEFAULT FALSE, is_available BOOLEAN NOT NULL DEFAULT FALSE, "
      "has_location BOOLEAN NOT NULL DEFAULT FALSE, latitude DOUBLE PRECISION NOT NULL DEFAULT 0, longitude DOUBLE PRECISION NOT NULL DEFAULT 0, "
      "last_seen_at_ms BIGINT NOT NULL DEFAULT 0, vehicle_type TEXT, service_tier TEXT, rating DOUBLE PRECISION NOT NULL DEFAULT 0, "
      "completed_rides INTEGER NOT NULL DEFAULT 0, available_since_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS driver_availability_dispatch_idx ON driver_availability(is_online, is_available);"};
  return kStatements;
}

} // namespace dispatch::db::sql
