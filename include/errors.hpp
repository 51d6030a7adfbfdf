#ifndef ERRORS_HPP
#define ERRORS_HPP

#include "types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

// Raster query outside the raster extent, or over a no-data pixel.
class OutOfBoundsError : public std::runtime_error {
public:
  OutOfBoundsError(double lat, double lon, const std::string &reason)
      : std::runtime_error("NDVI lookup failed at (" + std::to_string(lat) +
                           ", " + std::to_string(lon) + "): " + reason),
        lat_(lat), lon_(lon) {}

  double lat() const { return lat_; }
  double lon() const { return lon_; }

private:
  double lat_;
  double lon_;
};

class NoStationDataError : public std::runtime_error {
public:
  NoStationDataError() : std::runtime_error("No AQI station data available") {}
};

// Fatal: the raw graph is empty or an input could not be read.
class EnrichmentError : public std::runtime_error {
public:
  explicit EnrichmentError(const std::string &what)
      : std::runtime_error(what) {}
};

class GraphLoadError : public std::runtime_error {
public:
  explicit GraphLoadError(const std::string &what)
      : std::runtime_error(what) {}
};

// Routing failure. Lists the endpoint(s) that could not be reached.
class NoPathError : public std::runtime_error {
public:
  NoPathError(NodeID origin, NodeID destination,
              const std::vector<std::string> &unreachable)
      : std::runtime_error(describe(origin, destination, unreachable)),
        origin_(origin), destination_(destination), unreachable_(unreachable) {}

  NodeID origin() const { return origin_; }
  NodeID destination() const { return destination_; }
  const std::vector<std::string> &unreachable() const { return unreachable_; }

private:
  static std::string describe(NodeID origin, NodeID destination,
                              const std::vector<std::string> &unreachable) {
    std::string msg = "No route found from node " + std::to_string(origin) +
                      " to node " + std::to_string(destination);
    if (!unreachable.empty()) {
      msg += ": unreachable ";
      for (size_t i = 0; i < unreachable.size(); ++i) {
        if (i > 0)
          msg += ", ";
        msg += unreachable[i];
      }
    }
    return msg;
  }

  NodeID origin_;
  NodeID destination_;
  std::vector<std::string> unreachable_;
};

#endif // ERRORS_HPP
