#include "internal/pricing/fare_estimator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

namespace {

using dispatch::engine::core::v1::GeoPoint;
using dispatch::engine::core::v1::RideVariant;

class FixedGeo final : public dispatch::geo::GeoService {
 public:
  explicit FixedGeo(double km) : km_(km) {
  }
  double DistanceKm(const dispatch::geo::Coordinates&, const dispatch::geo::Coordinates&) const override {
    return km_;
  }
  uint32_t EtaMinutes(double) const override {
    return 0;
  }

 private:
  double km_;
};

dispatch::runtime::config::PricingConfig Pricing() {
  dispatch::runtime::config::PricingConfig config;
  config.set_base_fare(2.5);
  config.set_per_km(1.2);
  config.set_minimum_fare(5.0);
  config.set_currency("USD");
  return config;
}

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestDistanceFare() {
  dispatch::pricing::DistanceFareEstimator estimator(Pricing(), std::make_shared<FixedGeo>(10.0));
  const auto                               fare = estimator.Estimate(GeoPoint{}, GeoPoint{}, RideVariant{});
  assert(Near(fare.amount(), 14.5));
  assert(Near(fare.base_fare(), 2.5));
  assert(Near(fare.distance_fare(), 12.0));
  assert(Near(fare.distance_km(), 10.0));
  assert(fare.currency() == "USD");
}

void TestShortTripPaysMinimum() {
  dispatch::pricing::DistanceFareEstimator estimator(Pricing(), std::make_shared<FixedGeo>(1.0));
  const auto                               fare = estimator.Estimate(GeoPoint{}, GeoPoint{}, RideVariant{});
  assert(Near(fare.amount(), 5.0));
  assert(Near(fare.distance_fare(), 1.2));
}

void TestAmountsRoundToCents() {
  dispatch::pricing::DistanceFareEstimator estimator(Pricing(), std::make_shared<FixedGeo>(3.3333));
  const auto                               fare = estimator.Estimate(GeoPoint{}, GeoPoint{}, RideVariant{});
  assert(Near(fare.distance_fare(), 4.0));
  assert(Near(fare.amount(), 6.5));
}

void TestHaversineDistanceAndEta() {
  dispatch::geo::HaversineGeoService geo(30.0);

  const double one_degree = geo.DistanceKm({40.0, -74.0}, {41.0, -74.0});
  assert(one_degree > 111.0 && one_degree < 111.4);
  assert(geo.DistanceKm({40.0, -74.0}, {40.0, -74.0}) == 0.0);

  assert(geo.EtaMinutes(0) == 0);
  assert(geo.EtaMinutes(0.01) == 1);
  assert(geo.EtaMinutes(15.0) == 30);
}

void TestFareUsesGreatCircleDistance() {
  auto                                     geo = std::make_shared<dispatch::geo::HaversineGeoService>(30.0);
  dispatch::pricing::DistanceFareEstimator estimator(Pricing(), geo);

  GeoPoint pickup;
  pickup.set_latitude(40.0);
  pickup.set_longitude(-74.0);
  GeoPoint dropoff;
  dropoff.set_latitude(40.1);
  dropoff.set_longitude(-74.0);

  const auto fare = estimator.Estimate(pickup, dropoff, RideVariant{});
  assert(fare.distance_km() > 11.0 && fare.distance_km() < 11.2);
  assert(fare.amount() > 15.5 && fare.amount() < 15.9);
}

} // namespace

int main() {
  TestDistanceFare();
  TestShortTripPaysMinimum();
  TestAmountsRoundToCents();
  TestHaversineDistanceAndEta();
  TestFareUsesGreatCircleDistance();

  std::cout << "dispatch_unit_fare_estimator: pass\n";
  return 0;
}
