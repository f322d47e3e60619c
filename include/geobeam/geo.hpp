#pragma once
#include <cmath>
#include <numbers>
#include <optional>

namespace geobeam {

// Constant naming convention (kCamelCase)
inline constexpr double kPI = std::numbers::pi_v<double>;
inline constexpr double kDegToRad = kPI / 180.0;

// WGS84 ellipsoid
inline constexpr double kWgs84SemiMajorM = 6378137.0;
inline constexpr double kWgs84Eccentricity = 0.0818191908426;

// Mean earth radius used for waypoint spacing (haversine).
inline constexpr double kMeanEarthRadiusM = 6371008.8;

struct Ecef {
  double x{};
  double y{};
  double z{};
};

struct Enu {
  double east{};
  double north{};
  double up{};
};

// Geodetic -> ECEF. Pure; safe from any thread.
Ecef to_ecef(double lat_deg, double lon_deg, double alt_m);

// ECEF -> local east/north/up relative to a geodetic origin.
Enu ecef_to_enu(const Ecef& p, const Ecef& origin, double origin_lat_deg, double origin_lon_deg);

// Inverse of to_ecef (Bowring iteration); used to place an ENU origin.
void ecef_to_geodetic(const Ecef& p, double& lat_deg, double& lon_deg, double& alt_m);

// Great-circle distance in meters on a sphere of kMeanEarthRadiusM.
double haversine_m(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg);

// A waypoint. ECEF is derived from (lat, lon, alt) and only ever set through
// attach_ecef(); it is never edited on its own.
class GeoPoint {
public:
  GeoPoint() = default;
  GeoPoint(double lat_deg, double lon_deg) : lat_(lat_deg), lon_(lon_deg) {}
  GeoPoint(double lat_deg, double lon_deg, double alt_m)
    : lat_(lat_deg), lon_(lon_deg), alt_(alt_m) {}

  double latitude() const { return lat_; }
  double longitude() const { return lon_; }
  const std::optional<double>& altitude() const { return alt_; }
  const std::optional<Ecef>& ecef() const { return ecef_; }

  // Sets altitude and drops any stale ECEF.
  void set_altitude(double alt_m) { alt_ = alt_m; ecef_.reset(); }

  // Computes ECEF from the current altitude (0 m if none is known yet).
  void attach_ecef() { ecef_ = to_ecef(lat_, lon_, alt_.value_or(0.0)); }

  // Copy with ECEF attached.
  GeoPoint with_ecef() const { GeoPoint p = *this; p.attach_ecef(); return p; }

private:
  double lat_{0.0};
  double lon_{0.0};
  std::optional<double> alt_{};
  std::optional<Ecef> ecef_{};
};

} // namespace geobeam
