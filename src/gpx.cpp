#include <geobeam/waypoints.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string_view>
#include <expat.h>
#include <spdlog/fmt/fmt.h>
#include <geobeam/errors.hpp>
#include <geobeam/logging.hpp>

namespace geobeam {

namespace {

// Parse state shared with the expat callbacks. Only the first <trkseg> of
// the first <trk> is read.
struct GpxReader {
  std::vector<GeoPoint> points;
  bool in_trk = false;
  bool trk_done = false;
  bool in_seg = false;
  bool seg_done = false;
  bool in_pt = false;
  bool in_ele = false;
  std::optional<double> lat;
  std::optional<double> lon;
  std::optional<double> ele;
  std::string text;
  double prev_alt = 0.0;
  std::size_t skipped = 0;
};

struct ParserDeleter {
  void operator()(XML_Parser p) const { XML_ParserFree(p); }
};

// Namespace processing reports names as "uri|local".
std::string_view local_name(const XML_Char* name) {
  const char* sep = std::strrchr(name, '|');
  return sep ? std::string_view(sep + 1) : std::string_view(name);
}

std::optional<double> parse_number(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  if (s.empty()) return std::nullopt;
  const std::string text(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || errno == ERANGE) return std::nullopt;
  return v;
}

void XMLCALL on_start(void* user, const XML_Char* name, const XML_Char** attrs) {
  auto& r = *static_cast<GpxReader*>(user);
  const std::string_view el = local_name(name);
  if (el == "trk") {
    if (!r.trk_done) r.in_trk = true;
  } else if (el == "trkseg") {
    if (r.in_trk && !r.seg_done) r.in_seg = true;
  } else if (el == "trkpt" && r.in_seg) {
    r.in_pt = true;
    r.lat.reset();
    r.lon.reset();
    r.ele.reset();
    for (int i = 0; attrs[i] != nullptr; i += 2) {
      const std::string_view key = local_name(attrs[i]);
      if (key == "lat") r.lat = parse_number(attrs[i + 1]);
      else if (key == "lon") r.lon = parse_number(attrs[i + 1]);
    }
  } else if (el == "ele" && r.in_pt) {
    r.in_ele = true;
    r.text.clear();
  }
}

void XMLCALL on_end(void* user, const XML_Char* name) {
  auto& r = *static_cast<GpxReader*>(user);
  const std::string_view el = local_name(name);
  if (el == "ele" && r.in_ele) {
    r.in_ele = false;
    r.ele = parse_number(r.text);
  } else if (el == "trkpt" && r.in_pt) {
    r.in_pt = false;
    const bool valid = r.lat && r.lon &&
                       *r.lat >= -90.0 && *r.lat <= 90.0 &&
                       *r.lon >= -180.0 && *r.lon <= 180.0;
    if (!valid) { ++r.skipped; return; }
    const double alt = r.ele.value_or(r.prev_alt);
    r.prev_alt = alt;
    r.points.emplace_back(*r.lat, *r.lon, alt);
  } else if (el == "trkseg" && r.in_seg) {
    r.in_seg = false;
    r.seg_done = true;
  } else if (el == "trk" && r.in_trk) {
    r.in_trk = false;
    r.trk_done = true;
  }
}

void XMLCALL on_text(void* user, const XML_Char* s, int len) {
  auto& r = *static_cast<GpxReader*>(user);
  if (r.in_ele) r.text.append(s, static_cast<std::size_t>(len));
}

} // namespace

std::vector<GeoPoint> waypoints_from_gpx_stream(std::istream& in) {
  std::unique_ptr<XML_ParserStruct, ParserDeleter> parser(XML_ParserCreateNS(nullptr, '|'));
  if (!parser) throw TrackFileError("cannot create XML parser");

  GpxReader reader;
  XML_SetUserData(parser.get(), &reader);
  XML_SetElementHandler(parser.get(), on_start, on_end);
  XML_SetCharacterDataHandler(parser.get(), on_text);

  char buf[8192];
  for (;;) {
    in.read(buf, sizeof(buf));
    const auto n = static_cast<int>(in.gcount());
    const bool last = !in;
    if (XML_Parse(parser.get(), buf, n, last ? 1 : 0) == XML_STATUS_ERROR) {
      throw TrackFileError(fmt::format("GPX parse error at line {}: {}",
                                       XML_GetCurrentLineNumber(parser.get()),
                                       XML_ErrorString(XML_GetErrorCode(parser.get()))));
    }
    if (last) break;
  }

  if (!reader.seg_done) log()->warn("GPX file has no <trk>/<trkseg>");
  if (reader.skipped > 0) log()->debug("skipped {} GPX track points without a usable lat/lon", reader.skipped);
  return std::move(reader.points);
}

bool is_gpx_path(const std::string& path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return ext == ".gpx" || ext == ".xml";
}

std::optional<std::vector<GeoPoint>> load_waypoints_gpx(const std::string& path) {
  if (!is_gpx_path(path)) {
    throw TrackFileError("invalid file type, expected .gpx or .xml: " + path);
  }
  std::ifstream f(path, std::ios::binary);
  if (!f) return std::nullopt;
  return waypoints_from_gpx_stream(f);
}

} // namespace geobeam
