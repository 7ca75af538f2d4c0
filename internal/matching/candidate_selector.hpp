#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/geo/geo_service.hpp"

namespace dispatch::matching {

struct CandidateQuery {
  geo::Coordinates                pickup;
  std::string                     vehicle_type; // empty = any
  std::string                     service_tier; // empty = any
  std::unordered_set<std::string> exclude_driver_ids;
  uint32_t                        batch_size = 5;
};

struct Candidate {
  std::string driver_id;
  double      distance_km = 0;
  uint32_t    eta_minutes = 0;
  double      score       = 0;
};

/*
  CandidateSelector

  Filters dispatchable drivers (online, available, fresh heartbeat,
  compatible vehicle/service, not excluded), searches an expanding radius
  around the pickup, and ranks by a weighted score of distance, rating and
  idle time. Ties go to the lexicographically smaller driver_id.

  An empty result is the exhaustion signal.
*/
class CandidateSelector {
 public:
  CandidateSelector(std::shared_ptr<db::Repository> repository, std::shared_ptr<geo::GeoService> geo, dispatch::runtime::config::MatchingConfig config);

  std::vector<Candidate> SelectBatch(const CandidateQuery& query);

  // Ranking over already-loaded rows.
  std::vector<Candidate> Rank(const std::vector<db::model::DriverAvailabilityRecord>& drivers, const CandidateQuery& query, uint64_t now_ms) const;

 private:
  bool   Eligible(const db::model::DriverAvailabilityRecord& driver, const CandidateQuery& query, uint64_t now_ms) const;
  double Score(const db::model::DriverAvailabilityRecord& driver, double distance_km, uint64_t now_ms) const;

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<geo::GeoService>         geo_;
  dispatch::runtime::config::MatchingConfig config_;
};

} // namespace dispatch::matching
