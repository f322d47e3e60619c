#include <geobeam/geo.hpp>
#include <cmath>

namespace geobeam {

Ecef to_ecef(double lat_deg, double lon_deg, double alt_m) {
  const double e2 = kWgs84Eccentricity * kWgs84Eccentricity;
  const double lat = lat_deg * kDegToRad;
  const double lon = lon_deg * kDegToRad;

  const double sin_lat = std::sin(lat);
  const double cos_lat = std::cos(lat);
  const double sin_lon = std::sin(lon);
  const double cos_lon = std::cos(lon);

  // Prime vertical radius of curvature
  const double N = kWgs84SemiMajorM / std::sqrt(1.0 - e2 * sin_lat * sin_lat);

  return Ecef{
    (N + alt_m) * cos_lat * cos_lon,
    (N + alt_m) * cos_lat * sin_lon,
    ((1.0 - e2) * N + alt_m) * sin_lat
  };
}

Enu ecef_to_enu(const Ecef& p, const Ecef& origin, double origin_lat_deg, double origin_lon_deg) {
  const double lat = origin_lat_deg * kDegToRad;
  const double lon = origin_lon_deg * kDegToRad;
  const double dx = p.x - origin.x;
  const double dy = p.y - origin.y;
  const double dz = p.z - origin.z;

  const double sl = std::sin(lat), cl = std::cos(lat);
  const double so = std::sin(lon), co = std::cos(lon);

  return Enu{
    -so * dx + co * dy,
    -sl * co * dx - sl * so * dy + cl * dz,
     cl * co * dx + cl * so * dy + sl * dz
  };
}

void ecef_to_geodetic(const Ecef& p, double& lat_deg, double& lon_deg, double& alt_m) {
  const double e2 = kWgs84Eccentricity * kWgs84Eccentricity;
  const double lon = std::atan2(p.y, p.x);
  const double r = std::sqrt(p.x * p.x + p.y * p.y);

  double lat = std::atan2(p.z, r * (1.0 - e2));
  for (int iter = 0; iter < 10; ++iter) {
    const double s = std::sin(lat);
    const double N = kWgs84SemiMajorM / std::sqrt(1.0 - e2 * s * s);
    const double next = std::atan2(p.z + e2 * N * s, r);
    if (std::abs(next - lat) < 1e-12) { lat = next; break; }
    lat = next;
  }

  const double s = std::sin(lat);
  const double c = std::cos(lat);
  const double N = kWgs84SemiMajorM / std::sqrt(1.0 - e2 * s * s);
  if (std::abs(c) > 1e-10) {
    alt_m = r / c - N;
  } else {
    alt_m = std::abs(p.z) / std::abs(s) - N * (1.0 - e2); // near the poles
  }
  lat_deg = lat / kDegToRad;
  lon_deg = lon / kDegToRad;
}

double haversine_m(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg) {
  const double dlat = (lat2_deg - lat1_deg) * kDegToRad;
  const double dlon = (lon2_deg - lon1_deg) * kDegToRad;
  const double lat1 = lat1_deg * kDegToRad;
  const double lat2 = lat2_deg * kDegToRad;
  const double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(lat1) * std::cos(lat2) *
                   std::sin(dlon / 2) * std::sin(dlon / 2);
  return 2.0 * kMeanEarthRadiusM * std::asin(std::sqrt(h));
}

} // namespace geobeam
