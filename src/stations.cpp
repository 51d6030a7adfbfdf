#include "stations.hpp"
#include "errors.hpp"
#include "graph.hpp"
#include "types.hpp"
#include <cmath>
#include <fstream>
#include <iostream>

StationSet::StationSet(std::vector<StationReading> readings)
    : readings_(std::move(readings)) {}

StationSet StationSet::LoadCSV(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open())
    throw EnrichmentError("AQI station file not found: " + filename);

  std::cout << "[Stations] Loading AQI readings from " << filename << "..."
            << std::endl;

  std::vector<StationReading> readings;
  std::string line;
  std::getline(file, line); // Header
  int dropped = 0;

  while (std::getline(file, line)) {
    if (stripOuterQuotes(line).empty())
      continue;
    auto cols = parseCSVLine(line);
    if (cols.size() < 4) {
      dropped++;
      continue;
    }

    StationReading r;
    try {
      size_t used = 0;
      r.station_id = std::stoi(cols[0], &used);
      if (used != cols[0].size()) {
        dropped++;
        continue;
      }
      r.lat = std::stod(cols[1]);
      r.lon = std::stod(cols[2]);
      r.aqi = std::stod(cols[3]); // "-" and "" land in the catch
    } catch (const std::invalid_argument &) {
      dropped++;
      continue;
    } catch (const std::out_of_range &) {
      dropped++;
      continue;
    }
    if (!std::isfinite(r.aqi) || r.aqi < 0.0) {
      dropped++;
      continue;
    }
    if (cols.size() >= 5)
      r.timestamp = cols[4];
    readings.push_back(r);
  }

  std::cout << "[Stations] Loaded " << readings.size() << " stations";
  if (dropped > 0)
    std::cout << " (" << dropped << " without a usable AQI)";
  std::cout << "." << std::endl;
  return StationSet(std::move(readings));
}

const StationReading &StationSet::nearest(double lat, double lon) const {
  if (readings_.empty())
    throw NoStationDataError();

  const StationReading *best = nullptr;
  double minDist = INF;
  for (const auto &s : readings_) {
    double dist = haversine(lat, lon, s.lat, s.lon);
    if (!best || dist < minDist - STATION_TIE_EPSILON) {
      best = &s;
      minDist = dist;
    } else if (std::fabs(dist - minDist) <= STATION_TIE_EPSILON &&
               s.station_id < best->station_id) {
      best = &s;
      minDist = std::min(minDist, dist);
    }
  }
  return *best;
}

double StationSet::nearestAqi(double lat, double lon) const {
  return nearest(lat, lon).aqi;
}
