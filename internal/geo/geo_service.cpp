#include "geo_service.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace dispatch::geo {

namespace {

constexpr double kEarthRadiusKm = 6371.0;

double ToRadians(double degrees) {
  return degrees * std::numbers::pi / 180.0;
}

} // namespace

HaversineGeoService::HaversineGeoService(double average_speed_kmh) : average_speed_kmh_(average_speed_kmh > 0 ? average_speed_kmh : 30.0) {
}

double HaversineGeoService::DistanceKm(const Coordinates& from, const Coordinates& to) const {
  const double d_lat = ToRadians(to.latitude - from.latitude);
  const double d_lon = ToRadians(to.longitude - from.longitude);

  const double a = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
                   std::cos(ToRadians(from.latitude)) * std::cos(ToRadians(to.latitude)) * std::sin(d_lon / 2) * std::sin(d_lon / 2);
  const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return kEarthRadiusKm * c;
}

uint32_t HaversineGeoService::EtaMinutes(double distance_km) const {
  if (distance_km <= 0) return 0;
  // A driver already nearby still needs a minute to show up.
  return static_cast<uint32_t>(std::max<long>(1, std::lround(distance_km / average_speed_kmh_ * 60.0)));
}

} // namespace dispatch::geo
