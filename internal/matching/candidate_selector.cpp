#include "candidate_selector.hpp"

#include <algorithm>

#include "internal/model/conversions.hpp"
#include "internal/util/time.hpp"

namespace dispatch::matching {

namespace {

constexpr double   kMaxRating      = 5.0;
constexpr uint64_t kIdleSaturateMs = 30ull * 60 * 1000;

} // namespace

CandidateSelector::CandidateSelector(std::shared_ptr<db::Repository> repository, std::shared_ptr<geo::GeoService> geo,
                                     dispatch::runtime::config::MatchingConfig config)
    : repository_(std::move(repository)), geo_(std::move(geo)), config_(std::move(config)) {
}

std::vector<Candidate> CandidateSelector::SelectBatch(const CandidateQuery& query) {
  const uint64_t now_ms     = util::NowMillis();
  const uint64_t seen_since = now_ms > config_.heartbeat_ttl_ms() ? now_ms - config_.heartbeat_ttl_ms() : 0;

  std::vector<db::model::DriverAvailabilityRecord> drivers;
  {
    auto tx = repository_->Begin();
    drivers = repository_->ListDispatchableDrivers(*tx, seen_since);
    tx->Commit();
  }
  return Rank(drivers, query, now_ms);
}

std::vector<Candidate> CandidateSelector::Rank(const std::vector<db::model::DriverAvailabilityRecord>& drivers, const CandidateQuery& query,
                                               uint64_t now_ms) const {
  std::vector<std::pair<const db::model::DriverAvailabilityRecord*, double>> eligible;
  for (const auto& driver : drivers) {
    if (!Eligible(driver, query, now_ms)) continue;
    eligible.emplace_back(&driver, geo_->DistanceKm(query.pickup, model::LocationOf(driver)));
  }

  std::vector<Candidate> ranked;
  double                 radius = config_.initial_radius_km();
  for (;;) {
    for (const auto& [driver, distance] : eligible) {
      if (distance > radius) continue;
      ranked.push_back(Candidate{driver->driver_id, distance, geo_->EtaMinutes(distance), Score(*driver, distance, now_ms)});
    }
    if (!ranked.empty() || radius >= config_.max_radius_km() || config_.radius_step_km() <= 0) break;
    radius = std::min(config_.max_radius_km(), radius + config_.radius_step_km());
  }

  std::sort(ranked.begin(), ranked.end(), [](const Candidate& a, const Candidate& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.driver_id < b.driver_id;
  });
  if (ranked.size() > query.batch_size) ranked.resize(query.batch_size);
  return ranked;
}

bool CandidateSelector::Eligible(const db::model::DriverAvailabilityRecord& driver, const CandidateQuery& query, uint64_t now_ms) const {
  if (!driver.is_online || !driver.is_available || !driver.has_location) return false;
  if (query.exclude_driver_ids.contains(driver.driver_id)) return false;
  if (!query.vehicle_type.empty() && driver.vehicle_type != query.vehicle_type) return false;
  if (!query.service_tier.empty() && driver.service_tier != query.service_tier) return false;
  if (driver.last_seen_at_ms + config_.heartbeat_ttl_ms() < now_ms) return false;
  return true;
}

double CandidateSelector::Score(const db::model::DriverAvailabilityRecord& driver, double distance_km, uint64_t now_ms) const {
  const double max_radius     = config_.max_radius_km() > 0 ? config_.max_radius_km() : 1.0;
  const double distance_score = std::max(0.0, (max_radius - distance_km) / max_radius);
  const double rating_score   = std::clamp(driver.rating / kMaxRating, 0.0, 1.0);

  double idle_score = 0;
  if (driver.available_since_ms > 0 && now_ms > driver.available_since_ms) {
    idle_score = std::min(1.0, static_cast<double>(now_ms - driver.available_since_ms) / static_cast<double>(kIdleSaturateMs));
  }

  return config_.distance_weight() * distance_score + config_.rating_weight() * rating_score + config_.idle_weight() * idle_score;
}

} // namespace dispatch::matching
