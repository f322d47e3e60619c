#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <geobeam/geo.hpp>
#include <geobeam/route.hpp>

namespace geobeam {

// Stream-based waypoint loader (test-friendly; no filesystem required).
// Rows are lat,lon[,alt]. Accepts an optional header row; ignores lines
// starting with '#' and blank lines. Invalid rows are skipped. A row with no
// altitude reuses the previous point's altitude (0 for the first point).
std::vector<GeoPoint> waypoints_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<GeoPoint>> load_waypoints_csv(const std::string& path);

// GPX track loader. Reads the <trkpt lat lon> of the first <trkseg> of the
// first <trk>, with its optional <ele>. Points without <ele> (or with an
// unreadable one) reuse the previous altitude (0 for the first point); points
// with unreadable lat/lon are skipped. A missing or empty segment yields no
// points. Throws TrackFileError if the XML is not well-formed.
std::vector<GeoPoint> waypoints_from_gpx_stream(std::istream& in);

// True for the extensions the GPX loader accepts (.gpx, .xml; any case).
bool is_gpx_path(const std::string& path);

// Filesystem wrapper; returns nullopt if file cannot be opened. Throws
// TrackFileError when the extension is not .gpx or .xml.
std::optional<std::vector<GeoPoint>> load_waypoints_gpx(const std::string& path);

// GPX for .gpx/.xml files, CSV for everything else.
std::optional<std::vector<GeoPoint>> load_waypoints(const std::string& path);

// Build a Route from raw waypoints: haversine segment lengths, durations at
// nominal_speed (m/s), ECEF attached. Throws NoRouteFoundError if empty.
Route route_from_waypoints(const std::vector<GeoPoint>& points, double nominal_speed);

// Waypoint file (CSV or GPX) -> upsampled track at speed (m/s) and
// frequency (Hz). Throws NoRouteFoundError if the file is missing or holds no
// waypoints, TrackFileError if a GPX file is malformed.
TimedRoute timed_route_from_waypoint_file(const std::string& path, double speed, double frequency);

} // namespace geobeam
