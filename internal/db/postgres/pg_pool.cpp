#include "pg_pool.hpp"

namespace dispatch::db::postgres {

namespace {

constexpr const char* kRideColumns =
    "id,customer_id,pickup_lat,pickup_lon,pickup_address,dropoff_lat,dropoff_lon,dropoff_address,vehicle_type,service_tier,"
    "status,estimated_fare,currency,estimated_distance_km,assigned_driver_id,created_at_ms,assigned_at_ms,arrived_at_ms,"
    "started_at_ms,completed_at_ms,cancelled_at_ms,cancellation_reason";

constexpr const char* kOfferColumns =
    "id,ride_id,driver_id,batch_number,status,distance_km,eta_minutes,reject_reason,created_at_ms,expires_at_ms,responded_at_ms";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_ride", std::string("SELECT ") + kRideColumns + " FROM rides WHERE id=$1");
  conn.prepare("get_ride_for_update", std::string("SELECT ") + kRideColumns + " FROM rides WHERE id=$1 FOR UPDATE");

  conn.prepare("insert_ride", std::string("INSERT INTO rides(") + kRideColumns +
                                  ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20,$21,$22)");

  conn.prepare("update_ride_if_status",
               "UPDATE rides SET status=$2,estimated_fare=$3,currency=$4,estimated_distance_km=$5,assigned_driver_id=$6,"
               "assigned_at_ms=$7,arrived_at_ms=$8,started_at_ms=$9,completed_at_ms=$10,cancelled_at_ms=$11,cancellation_reason=$12 "
               "WHERE id=$1 AND status=$13");

  conn.prepare("get_offer", std::string("SELECT ") + kOfferColumns + " FROM ride_offers WHERE id=$1");

  conn.prepare("insert_offer", std::string("INSERT INTO ride_offers(") + kOfferColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");

  conn.prepare("accept_pending_offer",
               "UPDATE ride_offers SET status=2,responded_at_ms=$2 "
               "WHERE id=$1 AND status=1 AND expires_at_ms>$2 "
               "AND EXISTS (SELECT 1 FROM rides r WHERE r.id=ride_offers.ride_id AND r.status=1)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

void PgMigrationExecutor::ExecuteSQL(const std::string& sql) {
  auto           conn = pool_->Acquire();
  pqxx::nontransaction tx(*conn);
  tx.exec(sql);
}

} // namespace dispatch::db::postgres
