#pragma once

#include <cstdint>

namespace dispatch::geo {

struct Coordinates {
  double latitude  = 0;
  double longitude = 0;
};

/*
  Distance / ETA collaborator.

  The engine treats routing as a black box. The default implementation is
  great-circle distance at a fixed average speed.
*/
class GeoService {
 public:
  virtual ~GeoService() = default;

  virtual double   DistanceKm(const Coordinates& from, const Coordinates& to) const = 0;
  virtual uint32_t EtaMinutes(double distance_km) const                             = 0;
};

class HaversineGeoService final : public GeoService {
 public:
  explicit HaversineGeoService(double average_speed_kmh);

  double   DistanceKm(const Coordinates& from, const Coordinates& to) const override;
  uint32_t EtaMinutes(double distance_km) const override;

 private:
  double average_speed_kmh_;
};

} // namespace dispatch::geo
