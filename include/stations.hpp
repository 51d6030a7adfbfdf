#ifndef STATIONS_HPP
#define STATIONS_HPP

#include <string>
#include <vector>

struct StationReading {
  int station_id;
  double lat;
  double lon;
  double aqi;
  std::string timestamp;
};

// Immutable snapshot of AQI readings. A new fetch builds a new set.
class StationSet {
public:
  StationSet() = default;
  explicit StationSet(std::vector<StationReading> readings);

  // CSV: station_id,lat,lon,aqi[,timestamp]. Rows with an empty, "-",
  // non-numeric or negative AQI are dropped. Throws EnrichmentError if the
  // file cannot be opened.
  static StationSet LoadCSV(const std::string &filename);

  // AQI of the nearest station (haversine). Equidistant stations resolve to
  // the lower station_id. Throws NoStationDataError when the set is empty.
  double nearestAqi(double lat, double lon) const;
  const StationReading &nearest(double lat, double lon) const;

  const std::vector<StationReading> &readings() const { return readings_; }
  bool empty() const { return readings_.empty(); }
  size_t size() const { return readings_.size(); }

private:
  std::vector<StationReading> readings_;
};

#endif // STATIONS_HPP
