#pragma once

#include <memory>

#include "config/config.pb.h"
#include "dispatch/engine/core/v1/ride.pb.h"
#include "dispatch/engine/core/v1/types.pb.h"
#include "internal/geo/geo_service.hpp"

namespace dispatch::pricing {

/*
  Fare collaborator. Called once per ride before dispatch starts; the
  result is stored on the ride and shown in offers.
*/
class FareEstimator {
 public:
  virtual ~FareEstimator() = default;

  virtual dispatch::engine::core::v1::FareEstimate Estimate(const dispatch::engine::core::v1::GeoPoint&    pickup,
                                                            const dispatch::engine::core::v1::GeoPoint&    dropoff,
                                                            const dispatch::engine::core::v1::RideVariant& variant) const = 0;
};

// max(minimum_fare, base_fare + per_km * distance)
class DistanceFareEstimator final : public FareEstimator {
 public:
  DistanceFareEstimator(dispatch::runtime::config::PricingConfig config, std::shared_ptr<geo::GeoService> geo);

  dispatch::engine::core::v1::FareEstimate Estimate(const dispatch::engine::core::v1::GeoPoint&    pickup,
                                                    const dispatch::engine::core::v1::GeoPoint&    dropoff,
                                                    const dispatch::engine::core::v1::RideVariant& variant) const override;

 private:
  dispatch::runtime::config::PricingConfig config_;
  std::shared_ptr<geo::GeoService>         geo_;
};

} // namespace dispatch::pricing
