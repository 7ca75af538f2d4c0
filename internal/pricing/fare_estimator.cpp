#include "fare_estimator.hpp"

#include <algorithm>
#include <cmath>

namespace dispatch::pricing {

using namespace dispatch::engine::core::v1;

namespace {

double RoundCents(double amount) {
  return std::round(amount * 100.0) / 100.0;
}

} // namespace

DistanceFareEstimator::DistanceFareEstimator(dispatch::runtime::config::PricingConfig config, std::shared_ptr<geo::GeoService> geo)
    : config_(std::move(config)), geo_(std::move(geo)) {
}

FareEstimate DistanceFareEstimator::Estimate(const GeoPoint& pickup, const GeoPoint& dropoff, const RideVariant&) const {
  const double distance_km = geo_->DistanceKm({pickup.latitude(), pickup.longitude()}, {dropoff.latitude(), dropoff.longitude()});

  FareEstimate fare;
  fare.set_currency(config_.currency());
  fare.set_distance_km(distance_km);
  fare.set_base_fare(config_.base_fare());
  fare.set_distance_fare(RoundCents(config_.per_km() * distance_km));
  fare.set_amount(RoundCents(std::max(config_.minimum_fare(), config_.base_fare() + config_.per_km() * distance_km)));
  return fare;
}

} // namespace dispatch::pricing
