#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/events/event_outbox.hpp"
#include "internal/matching/acceptance_arbitrator.hpp"
#include "internal/matching/ride_state_machine.hpp"
#include "internal/realtime/connection_registry.hpp"
#include "internal/util/errors.hpp"

#if DISPATCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if DISPATCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using dispatch::db::ErrorCode;
using dispatch::db::Repository;
using dispatch::db::memory::MemoryRepository;
using dispatch::db::model::DriverAvailabilityRecord;
using dispatch::db::model::OfferRecord;
using dispatch::db::model::RideHistoryRecord;
using dispatch::db::model::RideRecord;
using namespace dispatch::engine::core::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

RideRecord MakeRide(const std::string& id) {
  RideRecord ride;
  ride.id                    = id;
  ride.customer_id           = "customer-" + id;
  ride.pickup_lat            = 40.75;
  ride.pickup_lon            = -73.99;
  ride.pickup_address        = "Pickup St";
  ride.dropoff_lat           = 40.80;
  ride.dropoff_lon           = -73.95;
  ride.dropoff_address       = "Dropoff Ave";
  ride.vehicle_type          = "sedan";
  ride.service_tier          = "standard";
  ride.status                = RIDE_STATUS_SEARCHING;
  ride.estimated_fare        = 9.75;
  ride.currency              = "USD";
  ride.estimated_distance_km = 6.04;
  ride.created_at_ms         = NowMs();
  return ride;
}

OfferRecord MakeOffer(const std::string& id, const std::string& ride_id, const std::string& driver_id, uint32_t batch, uint64_t expires_at_ms) {
  OfferRecord offer;
  offer.id            = id;
  offer.ride_id       = ride_id;
  offer.driver_id     = driver_id;
  offer.batch_number  = batch;
  offer.status        = OFFER_STATUS_PENDING;
  offer.distance_km   = 1.5;
  offer.eta_minutes   = 3;
  offer.created_at_ms = NowMs();
  offer.expires_at_ms = expires_at_ms;
  return offer;
}

DriverAvailabilityRecord MakeDriver(const std::string& id, uint64_t seen_at_ms) {
  DriverAvailabilityRecord driver;
  driver.driver_id          = id;
  driver.is_online          = true;
  driver.is_available       = true;
  driver.has_location       = true;
  driver.latitude           = 40.751;
  driver.longitude          = -73.991;
  driver.last_seen_at_ms    = seen_at_ms;
  driver.vehicle_type       = "sedan";
  driver.service_tier       = "standard";
  driver.rating             = 4.7;
  driver.completed_rides    = 42;
  driver.available_since_ms = seen_at_ms;
  return driver;
}

// A failed statement poisons a postgres transaction, so rejected writes run alone.
template <typename Write>
ErrorCode RejectedWrite(Repository& repo, Write write) {
  auto tx     = repo.Begin();
  auto result = write(*tx);
  assert(!result);
  tx->Rollback();
  return result.code;
}

void VerifyRideReadWrite(Repository& repo, const std::string& id) {
  const auto ride = MakeRide(id);
  {
    auto tx = repo.Begin();
    assert(repo.InsertRide(*tx, ride));
    tx->Commit();
  }
  assert(RejectedWrite(repo, [&](auto& tx) { return repo.InsertRide(tx, ride); }) == ErrorCode::AlreadyExists);

  auto tx   = repo.Begin();
  auto read = repo.GetRide(*tx, id);
  assert(read.has_value());
  assert(read->customer_id == ride.customer_id);
  assert(read->pickup_address == "Pickup St");
  assert(read->vehicle_type == "sedan");
  assert(read->status == RIDE_STATUS_SEARCHING);
  assert(read->estimated_fare == 9.75);
  assert(read->currency == "USD");
  assert(read->assigned_driver_id.empty());
  assert(read->assigned_at_ms == 0);

  auto assigned               = *read;
  assigned.status             = RIDE_STATUS_ASSIGNED;
  assigned.assigned_driver_id = id + "-driver";
  assigned.assigned_at_ms     = NowMs();
  // Trip details are immutable.
  assigned.pickup_address = "Elsewhere";
  assert(repo.UpdateRideIfStatus(*tx, assigned, RIDE_STATUS_SEARCHING));
  assert(repo.UpdateRideIfStatus(*tx, assigned, RIDE_STATUS_SEARCHING).code == ErrorCode::Conflict);

  read = repo.GetRide(*tx, id);
  assert(read->status == RIDE_STATUS_ASSIGNED);
  assert(read->assigned_driver_id == id + "-driver");
  assert(read->assigned_at_ms == assigned.assigned_at_ms);
  assert(read->pickup_address == "Pickup St");

  auto active = repo.FindActiveRideForDriver(*tx, id + "-driver");
  assert(active.has_value() && active->id == id);
  assert(!repo.FindActiveRideForDriver(*tx, id + "-nobody").has_value());

  auto missing = MakeRide(id + "-missing");
  assert(repo.UpdateRideIfStatus(*tx, missing, RIDE_STATUS_SEARCHING).code == ErrorCode::NotFound);
  assert(!repo.GetRide(*tx, id + "-missing").has_value());

  tx->Commit();
}

void VerifyHistorySequence(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertRide(*tx, MakeRide(id)));

  for (auto to : {RIDE_STATUS_SEARCHING, RIDE_STATUS_ASSIGNED, RIDE_STATUS_CANCELLED}) {
    RideHistoryRecord entry;
    entry.ride_id       = id;
    entry.from_status   = to == RIDE_STATUS_SEARCHING ? RIDE_STATUS_UNSPECIFIED : RIDE_STATUS_SEARCHING;
    entry.to_status     = to;
    entry.actor         = "customer";
    entry.reason        = "step";
    entry.driver_id     = to == RIDE_STATUS_SEARCHING ? "" : "driver-1";
    entry.created_at_ms = NowMs();
    assert(repo.AppendRideHistory(*tx, entry));
  }

  const auto history = repo.ListRideHistory(*tx, id);
  assert(history.size() == 3);
  for (std::size_t i = 0; i < history.size(); ++i) assert(history[i].sequence == i + 1);
  assert(history[0].driver_id.empty());
  assert(history[2].to_status == RIDE_STATUS_CANCELLED);
  assert(history[2].driver_id == "driver-1");
  assert(repo.ListRideHistory(*tx, id + "-none").empty());
  tx->Commit();
}

void VerifyOfferLifecycle(Repository& repo, const std::string& id) {
  const uint64_t now = NowMs();
  {
    auto tx = repo.Begin();
    assert(repo.InsertRide(*tx, MakeRide(id)));
    assert(repo.MaxBatchNumber(*tx, id) == 0);

    assert(repo.InsertOffer(*tx, MakeOffer(id + "-o1", id, id + "-d1", 1, now - 1)));
    assert(repo.InsertOffer(*tx, MakeOffer(id + "-o2", id, id + "-d2", 1, now - 1)));
    assert(repo.InsertOffer(*tx, MakeOffer(id + "-o3", id, id + "-d3", 2, now + 30'000)));
    assert(repo.InsertOffer(*tx, MakeOffer(id + "-o4", id, id + "-d4", 2, now + 30'000)));
    tx->Commit();
  }
  assert(RejectedWrite(repo, [&](auto& tx) { return repo.InsertOffer(tx, MakeOffer(id + "-o1", id, id + "-d1", 1, now)); }) ==
         ErrorCode::AlreadyExists);
  RejectedWrite(repo, [&](auto& tx) { return repo.InsertOffer(tx, MakeOffer(id + "-orphan", id + "-no-ride", id + "-d1", 1, now)); });

  auto tx = repo.Begin();
  assert(repo.MaxBatchNumber(*tx, id) == 2);

  // Batch 1 window elapsed.
  std::vector<OfferRecord> expired;
  assert(repo.ResolvePendingOffersForRide(*tx, id, 1u, OFFER_STATUS_EXPIRED, now, expired));
  assert(expired.size() == 2);

  // Expired or past-deadline offers cannot be accepted.
  assert(repo.AcceptPendingOffer(*tx, id + "-o1", now).code == ErrorCode::Conflict);
  assert(repo.AcceptPendingOffer(*tx, id + "-missing", now).code == ErrorCode::NotFound);

  assert(repo.ResolvePendingOffer(*tx, id + "-o4", OFFER_STATUS_REJECTED, "too_far", now));
  assert(repo.ResolvePendingOffer(*tx, id + "-o4", OFFER_STATUS_REJECTED, "too_far", now).code == ErrorCode::Conflict);

  const auto pending = repo.ListPendingOffersForDriver(*tx, id + "-d3", now);
  assert(pending.size() == 1 && pending[0].id == id + "-o3");
  assert(repo.ListPendingOffersForDriver(*tx, id + "-d1", now).empty());

  assert(repo.AcceptPendingOffer(*tx, id + "-o3", now));
  std::vector<OfferRecord> superseded;
  assert(repo.ResolvePendingOffersForRide(*tx, id, std::nullopt, OFFER_STATUS_SUPERSEDED, now, superseded));
  assert(superseded.empty());

  const auto offers = repo.ListOffersForRide(*tx, id);
  assert(offers.size() == 4);
  assert(offers[0].batch_number == 1 && offers[3].batch_number == 2);
  for (const auto& offer : offers) {
    if (offer.id == id + "-o3") {
      assert(offer.status == OFFER_STATUS_ACCEPTED);
      assert(offer.responded_at_ms == now);
    } else if (offer.id == id + "-o4") {
      assert(offer.status == OFFER_STATUS_REJECTED);
      assert(offer.reject_reason == "too_far");
    } else {
      assert(offer.status == OFFER_STATUS_EXPIRED);
    }
  }
  tx->Commit();
}

void VerifyAcceptRequiresSearchingRide(Repository& repo, const std::string& id) {
  const uint64_t now = NowMs();
  auto           tx  = repo.Begin();
  auto           ride = MakeRide(id);
  assert(repo.InsertRide(*tx, ride));
  assert(repo.InsertOffer(*tx, MakeOffer(id + "-o1", id, id + "-d1", 1, now + 30'000)));

  auto cancelled            = ride;
  cancelled.status          = RIDE_STATUS_CANCELLED;
  cancelled.cancelled_at_ms = now;
  assert(repo.UpdateRideIfStatus(*tx, cancelled, RIDE_STATUS_SEARCHING));
  assert(repo.AcceptPendingOffer(*tx, id + "-o1", now).code == ErrorCode::Conflict);
  tx->Commit();
}

void VerifyDriverAvailability(Repository& repo, const std::string& prefix) {
  const uint64_t now = NowMs();
  auto           tx  = repo.Begin();

  assert(repo.UpsertDriverAvailability(*tx, MakeDriver(prefix + "-fresh", now)));
  assert(repo.UpsertDriverAvailability(*tx, MakeDriver(prefix + "-stale", now - 600'000)));
  auto busy         = MakeDriver(prefix + "-busy", now);
  busy.is_available = false;
  assert(repo.UpsertDriverAvailability(*tx, busy));

  auto read = repo.GetDriverAvailability(*tx, prefix + "-fresh");
  assert(read.has_value());
  assert(read->vehicle_type == "sedan");
  assert(read->rating == 4.7);
  assert(read->completed_rides == 42);

  auto dispatchable = repo.ListDispatchableDrivers(*tx, now - 300'000);
  std::size_t mine  = 0;
  for (const auto& driver : dispatchable) {
    if (driver.driver_id.rfind(prefix, 0) == 0) {
      ++mine;
      assert(driver.driver_id == prefix + "-fresh");
    }
  }
  assert(mine == 1);

  assert(repo.TouchDriverLocation(*tx, prefix + "-fresh", 40.76, -73.98, now + 5));
  assert(repo.TouchDriverLocation(*tx, prefix + "-ghost", 40.76, -73.98, now).code == ErrorCode::NotFound);
  read = repo.GetDriverAvailability(*tx, prefix + "-fresh");
  assert(read->latitude == 40.76);
  assert(read->last_seen_at_ms == now + 5);

  assert(repo.SetDriverOnline(*tx, prefix + "-fresh", false, now + 6));
  assert(!repo.GetDriverAvailability(*tx, prefix + "-fresh")->is_online);
  assert(repo.SetDriverOnline(*tx, prefix + "-ghost", true, now).code == ErrorCode::NotFound);

  assert(repo.SetDriverAvailable(*tx, prefix + "-busy", true, now + 7));
  read = repo.GetDriverAvailability(*tx, prefix + "-busy");
  assert(read->is_available);
  assert(read->available_since_ms == now + 7);
  assert(repo.SetDriverAvailable(*tx, prefix + "-busy", false, now + 8));
  assert(repo.GetDriverAvailability(*tx, prefix + "-busy")->available_since_ms == 0);

  tx->Commit();
}

void VerifyListRidesByStatus(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();
  auto a  = MakeRide(prefix + "-a");
  auto b  = MakeRide(prefix + "-b");
  b.created_at_ms = a.created_at_ms + 1;
  assert(repo.InsertRide(*tx, b));
  assert(repo.InsertRide(*tx, a));

  std::vector<std::string> mine;
  for (const auto& ride : repo.ListRidesByStatus(*tx, RIDE_STATUS_SEARCHING)) {
    if (ride.id.rfind(prefix, 0) == 0) mine.push_back(ride.id);
  }
  assert(mine == (std::vector<std::string>{prefix + "-a", prefix + "-b"}));
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRide(*tx, MakeRide(id)));
    tx->Rollback();
  }
  {
    // Dropping an open transaction rolls it back too.
    auto tx = repo.Begin();
    assert(repo.UpsertDriverAvailability(*tx, MakeDriver(id + "-driver", NowMs())));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetRide(*check_tx, id).has_value());
  assert(!repo.GetDriverAvailability(*check_tx, id + "-driver").has_value());
  check_tx->Commit();
}

// Two writers race the same searching -> assigned compare-and-set.
void VerifyConcurrentAssignment(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRide(*tx, MakeRide(id)));
    tx->Commit();
  }

  std::atomic<int> won{0};
  std::atomic<int> lost{0};
  auto             assign = [&](const std::string& driver_id) {
    auto tx   = repo.Begin();
    auto ride = repo.GetRide(*tx, id);
    assert(ride.has_value());
    if (ride->status != RIDE_STATUS_SEARCHING) {
      ++lost;
      tx->Rollback();
      return;
    }
    ride->status             = RIDE_STATUS_ASSIGNED;
    ride->assigned_driver_id = driver_id;
    auto result              = repo.UpdateRideIfStatus(*tx, *ride, RIDE_STATUS_SEARCHING);
    if (!result) {
      assert(result.code == ErrorCode::Conflict || result.code == ErrorCode::SerializationFailure);
      ++lost;
      tx->Rollback();
      return;
    }
    tx->Commit();
    ++won;
  };

  std::thread first(assign, "driver-a");
  std::thread second(assign, "driver-b");
  first.join();
  second.join();

  assert(won.load() == 1);
  assert(lost.load() == 1);

  auto verify_tx = repo.Begin();
  auto final     = repo.GetRide(*verify_tx, id);
  assert(final.has_value());
  assert(final->status == RIDE_STATUS_ASSIGNED);
  assert(final->assigned_driver_id == "driver-a" || final->assigned_driver_id == "driver-b");
  verify_tx->Commit();
}

struct Arbitration {
  std::shared_ptr<dispatch::matching::RideStateMachine> machine;
  std::shared_ptr<dispatch::events::EventOutbox>        outbox;
  dispatch::matching::AcceptanceArbitrator              arbitrator;

  explicit Arbitration(const std::shared_ptr<Repository>& repo)
      : machine(std::make_shared<dispatch::matching::RideStateMachine>(repo)),
        outbox(std::make_shared<dispatch::events::EventOutbox>(std::make_shared<dispatch::realtime::ConnectionRegistry>())),
        arbitrator(repo, machine, outbox, nullptr) {
    outbox->Start();
  }
  ~Arbitration() {
    outbox->Stop();
  }
};

void InsertSearchingRideWithOffers(Repository& repo, const std::string& id, int drivers) {
  const uint64_t now = NowMs();
  auto           tx  = repo.Begin();
  assert(repo.InsertRide(*tx, MakeRide(id)));
  for (int i = 0; i < drivers; ++i) {
    const auto driver = id + "-d" + std::to_string(i);
    assert(repo.UpsertDriverAvailability(*tx, MakeDriver(driver, now)));
    assert(repo.InsertOffer(*tx, MakeOffer(id + "-o" + std::to_string(i), id, driver, 1, now + 30'000)));
  }
  tx->Commit();
}

// Two drivers accept offers on one ride at the same moment.
void VerifyConcurrentAccept(const std::shared_ptr<Repository>& repo, const std::string& id) {
  InsertSearchingRideWithOffers(*repo, id, 2);
  Arbitration arbitration(repo);

  dispatch::matching::AcceptResult results[2];
  std::thread                      first([&] { results[0] = arbitration.arbitrator.TryAccept(id, id + "-d0"); });
  std::thread                      second([&] { results[1] = arbitration.arbitrator.TryAccept(id, id + "-d1"); });
  first.join();
  second.join();

  const int winner = results[0].outcome == ARBITRATION_OUTCOME_WON ? 0 : 1;
  const int loser  = 1 - winner;
  assert(results[winner].outcome == ARBITRATION_OUTCOME_WON);
  assert(results[loser].outcome == ARBITRATION_OUTCOME_LOST_RACE);

  auto tx   = repo->Begin();
  auto ride = repo->GetRide(*tx, id);
  assert(ride.has_value());
  assert(ride->status == RIDE_STATUS_ASSIGNED);
  assert(ride->assigned_driver_id == id + "-d" + std::to_string(winner));
  assert(repo->GetOffer(*tx, id + "-o" + std::to_string(winner))->status == OFFER_STATUS_ACCEPTED);
  assert(repo->GetOffer(*tx, id + "-o" + std::to_string(loser))->status == OFFER_STATUS_SUPERSEDED);
  assert(repo->ListRideHistory(*tx, id).size() == 1);
  tx->Commit();
}

// A customer cancel and a driver accept land together. Both take the ride
// row before any offer, so neither deadlocks and no offer stays pending.
void VerifyCancelRacingAccept(const std::shared_ptr<Repository>& repo, const std::string& id) {
  InsertSearchingRideWithOffers(*repo, id, 1);
  Arbitration arbitration(repo);

  dispatch::matching::AcceptResult accept;
  bool                             cancelled = false;
  std::thread                      accepting([&] { accept = arbitration.arbitrator.TryAccept(id, id + "-d0"); });
  std::thread                      cancelling([&] {
    std::vector<OfferRecord> expired;
    auto                     tx   = repo->Begin();
    auto                     ride = repo->GetRideForUpdate(*tx, id);
    assert(ride.has_value());
    arbitration.machine->ApplyInTransaction(*tx, *ride, RIDE_STATUS_CANCELLED, {"customer", "changed_plans", ""}, NowMs());
    assert(repo->ResolvePendingOffersForRide(*tx, id, std::nullopt, OFFER_STATUS_EXPIRED, NowMs(), expired));
    tx->Commit();
    cancelled = true;
  });
  accepting.join();
  cancelling.join();
  assert(cancelled);

  auto tx   = repo->Begin();
  auto ride = repo->GetRide(*tx, id);
  assert(ride.has_value());
  assert(ride->status == RIDE_STATUS_CANCELLED);

  const auto offer   = repo->GetOffer(*tx, id + "-o0");
  const auto history = repo->ListRideHistory(*tx, id);
  tx->Commit();
  assert(offer.has_value());
  if (accept.outcome == ARBITRATION_OUTCOME_WON) {
    assert(offer->status == OFFER_STATUS_ACCEPTED);
    assert(history.size() == 2);
    assert(history[0].to_status == RIDE_STATUS_ASSIGNED);
  } else {
    assert(offer->status == OFFER_STATUS_EXPIRED);
    assert(history.size() == 1);
  }
  assert(history.back().to_status == RIDE_STATUS_CANCELLED);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  const uint64_t now  = NowMs();
  auto           repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertRide(*tx, MakeRide(id)));
    assert(repo->InsertOffer(*tx, MakeOffer(id + "-o1", id, "d1", 1, now + 30'000)));
    assert(repo->UpsertDriverAvailability(*tx, MakeDriver(id + "-driver", now)));

    RideHistoryRecord entry;
    entry.ride_id       = id;
    entry.to_status     = RIDE_STATUS_SEARCHING;
    entry.actor         = "customer";
    entry.reason        = "ride_requested";
    entry.created_at_ms = now;
    assert(repo->AppendRideHistory(*tx, entry));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx   = repo->Begin();
  auto ride = repo->GetRide(*tx, id);
  assert(ride.has_value());
  assert(ride->status == RIDE_STATUS_SEARCHING);
  assert(ride->estimated_fare == 9.75);

  auto offers = repo->ListOffersForRide(*tx, id);
  assert(offers.size() == 1);
  assert(offers[0].status == OFFER_STATUS_PENDING);
  assert(offers[0].expires_at_ms == now + 30'000);

  assert(repo->GetDriverAvailability(*tx, id + "-driver").has_value());
  assert(repo->ListRideHistory(*tx, id).size() == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if DISPATCH_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("dispatch_engine_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto                                          db = std::make_shared<dispatch::db::sqlite::SqliteDB>(db_path);
    dispatch::db::sqlite::SqliteMigrationExecutor executor(*db);
    dispatch::db::sql::RunMigrations(executor, dispatch::db::sql::SqliteSchema());
    return std::make_shared<dispatch::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if DISPATCH_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("DISPATCH_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("DISPATCH_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<Repository> {
    auto                                      pool = std::make_shared<dispatch::db::postgres::PgPool>(conninfo);
    dispatch::db::postgres::PgMigrationExecutor executor(pool);
    dispatch::db::sql::RunMigrations(executor, dispatch::db::sql::PostgresSchema());
    return std::make_shared<dispatch::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // Postgres keeps rows across runs.
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifyRideReadWrite(*repo, run + "-ride");
  VerifyHistorySequence(*repo, run + "-history");
  VerifyOfferLifecycle(*repo, run + "-offers");
  VerifyAcceptRequiresSearchingRide(*repo, run + "-accept");
  VerifyDriverAvailability(*repo, run + "-drivers");
  VerifyListRidesByStatus(*repo, run + "-list");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyConcurrentAssignment(*repo, run + "-race");
  VerifyConcurrentAccept(repo, run + "-accept-race");
  VerifyCancelRacingAccept(repo, run + "-cancel-race");

  repo.reset();
  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if DISPATCH_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if DISPATCH_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "dispatch_integration_repository_parity: pass\n";
  return 0;
}
