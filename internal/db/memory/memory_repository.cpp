#include "memory_repository.hpp"

#include <algorithm>

#include "internal/model/ride_status.hpp"
#include "memory_tx.hpp"

namespace dispatch::db::memory {

using namespace dispatch::engine::core::v1;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Rides
// ------------------------------------------------------------------

Result MemoryRepository::InsertRide(Transaction& t, const model::RideRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.rides.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "ride " + r.id + " already exists");
  s.rides[r.id] = r;
  return Result::Ok();
}

std::optional<model::RideRecord> MemoryRepository::GetRide(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.rides.find(id);
  if (it == s.rides.end()) return std::nullopt;
  return it->second;
}

// The transaction already holds the repository mutex.
std::optional<model::RideRecord> MemoryRepository::GetRideForUpdate(Transaction& t, const std::string& id) {
  return GetRide(t, id);
}

std::vector<model::RideRecord> MemoryRepository::ListRidesByStatus(Transaction& t, RideStatus status) {
  std::vector<model::RideRecord> out;
  for (const auto& [_, ride] : TX(t).View().rides) {
    if (ride.status == status) out.push_back(ride);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  return out;
}

std::optional<model::RideRecord> MemoryRepository::FindActiveRideForDriver(Transaction& t, const std::string& driver_id) {
  for (const auto& [_, ride] : TX(t).View().rides) {
    if (ride.assigned_driver_id == driver_id && dispatch::model::HoldsDriver(ride.status) && !dispatch::model::IsTerminal(ride.status)) {
      return ride;
    }
  }
  return std::nullopt;
}

Result MemoryRepository::UpdateRideIfStatus(Transaction& t, const model::RideRecord& r, RideStatus expected) {
  auto& s  = TX(t).Mutable();
  auto  it = s.rides.find(r.id);
  if (it == s.rides.end()) return Result::Err(ErrorCode::NotFound, "ride " + r.id + " not found");
  if (it->second.status != expected) return Result::Err(ErrorCode::Conflict, "ride " + r.id + " status changed concurrently");

  // id, customer and trip details are immutable once inserted.
  const auto& stored      = it->second;
  auto        updated     = r;
  updated.customer_id     = stored.customer_id;
  updated.pickup_lat      = stored.pickup_lat;
  updated.pickup_lon      = stored.pickup_lon;
  updated.pickup_address  = stored.pickup_address;
  updated.dropoff_lat     = stored.dropoff_lat;
  updated.dropoff_lon     = stored.dropoff_lon;
  updated.dropoff_address = stored.dropoff_address;
  updated.vehicle_type    = stored.vehicle_type;
  updated.service_tier    = stored.service_tier;
  updated.created_at_ms   = stored.created_at_ms;
  it->second              = std::move(updated);
  return Result::Ok();
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result MemoryRepository::AppendRideHistory(Transaction& t, model::RideHistoryRecord& r) {
  auto& entries = TX(t).Mutable().history[r.ride_id];
  r.sequence    = entries.size() + 1;
  entries.push_back(r);
  return Result::Ok();
}

std::vector<model::RideHistoryRecord> MemoryRepository::ListRideHistory(Transaction& t, const std::string& ride_id) {
  const auto& s  = TX(t).View();
  auto        it = s.history.find(ride_id);
  if (it == s.history.end()) return {};
  return it->second;
}

// ------------------------------------------------------------------
// Offers
// ------------------------------------------------------------------

Result MemoryRepository::InsertOffer(Transaction& t, const model::OfferRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.offers.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "offer " + r.id + " already exists");
  if (!s.rides.contains(r.ride_id)) return Result::Err(ErrorCode::ConstraintViolation, "offer references unknown ride " + r.ride_id);
  s.offers[r.id] = r;
  s.offers_by_ride[r.ride_id].push_back(r.id);
  return Result::Ok();
}

std::optional<model::OfferRecord> MemoryRepository::GetOffer(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.offers.find(id);
  if (it == s.offers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::OfferRecord> MemoryRepository::ListOffersForRide(Transaction& t, const std::string& ride_id) {
  const auto&                     s = TX(t).View();
  std::vector<model::OfferRecord> out;
  auto                            it = s.offers_by_ride.find(ride_id);
  if (it == s.offers_by_ride.end()) return out;

  for (const auto& offer_id : it->second) {
    out.push_back(s.offers.at(offer_id));
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.batch_number != b.batch_number ? a.batch_number < b.batch_number : a.created_at_ms < b.created_at_ms;
  });
  return out;
}

std::vector<model::OfferRecord> MemoryRepository::ListPendingOffersForDriver(Transaction& t, const std::string& driver_id, uint64_t now_ms) {
  std::vector<model::OfferRecord> out;
  for (const auto& [_, offer] : TX(t).View().offers) {
    if (offer.driver_id == driver_id && offer.status == OFFER_STATUS_PENDING && offer.expires_at_ms > now_ms) {
      out.push_back(offer);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; });
  return out;
}

uint32_t MemoryRepository::MaxBatchNumber(Transaction& t, const std::string& ride_id) {
  uint32_t max_batch = 0;
  for (const auto& offer : ListOffersForRide(t, ride_id)) {
    max_batch = std::max(max_batch, offer.batch_number);
  }
  return max_batch;
}

Result MemoryRepository::AcceptPendingOffer(Transaction& t, const std::string& offer_id, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.offers.find(offer_id);
  if (it == s.offers.end()) return Result::Err(ErrorCode::NotFound, "offer " + offer_id + " not found");

  auto& offer = it->second;
  auto  ride  = s.rides.find(offer.ride_id);
  if (offer.status != OFFER_STATUS_PENDING || offer.expires_at_ms <= now_ms || ride == s.rides.end() ||
      ride->second.status != RIDE_STATUS_SEARCHING) {
    return Result::Err(ErrorCode::Conflict, "offer " + offer_id + " is not acceptable");
  }

  offer.status          = OFFER_STATUS_ACCEPTED;
  offer.responded_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::ResolvePendingOffer(Transaction& t, const std::string& offer_id, OfferStatus to, const std::string& reason, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.offers.find(offer_id);
  if (it == s.offers.end()) return Result::Err(ErrorCode::NotFound, "offer " + offer_id + " not found");
  if (it->second.status != OFFER_STATUS_PENDING) return Result::Err(ErrorCode::Conflict, "offer " + offer_id + " is no longer pending");

  it->second.status          = to;
  it->second.responded_at_ms = now_ms;
  it->second.reject_reason   = reason;
  return Result::Ok();
}

Result MemoryRepository::ResolvePendingOffersForRide(Transaction& t, const std::string& ride_id, std::optional<uint32_t> batch_number, OfferStatus to,
                                                     uint64_t now_ms, std::vector<model::OfferRecord>& resolved) {
  auto& s  = TX(t).Mutable();
  auto  it = s.offers_by_ride.find(ride_id);
  if (it == s.offers_by_ride.end()) return Result::Ok();

  for (const auto& offer_id : it->second) {
    auto& offer = s.offers.at(offer_id);
    if (offer.status != OFFER_STATUS_PENDING) continue;
    if (batch_number.has_value() && offer.batch_number != *batch_number) continue;

    offer.status          = to;
    offer.responded_at_ms = now_ms;
    resolved.push_back(offer);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Drivers
// ------------------------------------------------------------------

Result MemoryRepository::UpsertDriverAvailability(Transaction& t, const model::DriverAvailabilityRecord& r) {
  TX(t).Mutable().drivers[r.driver_id] = r;
  return Result::Ok();
}

std::optional<model::DriverAvailabilityRecord> MemoryRepository::GetDriverAvailability(Transaction& t, const std::string& driver_id) {
  const auto& s  = TX(t).View();
  auto        it = s.drivers.find(driver_id);
  if (it == s.drivers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DriverAvailabilityRecord> MemoryRepository::ListDispatchableDrivers(Transaction& t, uint64_t seen_since_ms) {
  std::vector<model::DriverAvailabilityRecord> out;
  for (const auto& [_, driver] : TX(t).View().drivers) {
    if (driver.is_online && driver.is_available && driver.has_location && driver.last_seen_at_ms >= seen_since_ms) {
      out.push_back(driver);
    }
  }
  return out;
}

Result MemoryRepository::TouchDriverLocation(Transaction& t, const std::string& driver_id, double latitude, double longitude, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.drivers.find(driver_id);
  if (it == s.drivers.end()) return Result::Err(ErrorCode::NotFound, "driver " + driver_id + " has no availability record");

  it->second.has_location    = true;
  it->second.latitude        = latitude;
  it->second.longitude       = longitude;
  it->second.last_seen_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::SetDriverOnline(Transaction& t, const std::string& driver_id, bool online, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.drivers.find(driver_id);
  if (it == s.drivers.end()) return Result::Err(ErrorCode::NotFound, "driver " + driver_id + " has no availability record");

  it->second.is_online       = online;
  it->second.last_seen_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::SetDriverAvailable(Transaction& t, const std::string& driver_id, bool available, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.drivers.find(driver_id);
  if (it == s.drivers.end()) return Result::Err(ErrorCode::NotFound, "driver " + driver_id + " has no availability record");

  it->second.is_available       = available;
  it->second.available_since_ms = available ? now_ms : 0;
  return Result::Ok();
}

} // namespace dispatch::db::memory
