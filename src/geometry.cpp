#include "geometry.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

Coordinate pointAlong(const Polyline &line, double fraction) {
  if (line.empty())
    throw std::invalid_argument("pointAlong: empty geometry");
  if (line.size() == 1)
    return line.front();

  fraction = std::max(0.0, std::min(1.0, fraction));
  double total = polylineLength(line);
  if (total <= 0.0)
    return line.front();

  double target = fraction * total;
  double walked = 0.0;
  for (size_t i = 1; i < line.size(); ++i) {
    const Coordinate &a = line[i - 1];
    const Coordinate &b = line[i];
    double seg = haversine(a.lat, a.lon, b.lat, b.lon);
    if (seg > 0.0 && walked + seg >= target) {
      // Linear interpolation in degrees is fine at street-segment scale
      double t = (target - walked) / seg;
      return {a.lat + (b.lat - a.lat) * t, a.lon + (b.lon - a.lon) * t};
    }
    walked += seg;
  }
  return line.back();
}

Coordinate midpoint(const Polyline &line) { return pointAlong(line, 0.5); }

std::vector<Coordinate> samplePoints(const Polyline &line, int count) {
  count = std::max(count, MIN_NDVI_SAMPLES);
  std::vector<Coordinate> points;
  points.reserve(count);
  for (int i = 0; i < count; ++i)
    points.push_back(pointAlong(line, static_cast<double>(i) / (count - 1)));
  return points;
}

Polyline reversed(const Polyline &line) {
  return Polyline(line.rbegin(), line.rend());
}

Polyline parseGeometry(const std::string &text) {
  Polyline line;
  std::stringstream ss(text);
  std::string pair;
  while (std::getline(ss, pair, ';')) {
    std::istringstream ps(pair);
    double lon, lat;
    if (!(ps >> lon >> lat))
      continue;
    line.push_back({lat, lon});
  }
  return line;
}

std::string formatGeometry(const Polyline &line) {
  std::ostringstream out;
  out << std::setprecision(10);
  for (size_t i = 0; i < line.size(); ++i) {
    if (i > 0)
      out << ';';
    out << line[i].lon << ' ' << line[i].lat;
  }
  return out.str();
}
