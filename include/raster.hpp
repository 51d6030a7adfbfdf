#ifndef RASTER_HPP
#define RASTER_HPP

#include "types.hpp"
#include <string>
#include <vector>

// Greenness raster in EPSG:4326, north-up, square cells. Read-only once
// loaded; every query is nearest-pixel.
class NdviRaster {
public:
  NdviRaster(int cols, int rows, double xllcorner, double yllcorner,
             double cellSize, std::vector<float> values,
             double nodata = -9999.0);

  // ESRI ASCII grid (.asc). Throws EnrichmentError if the file cannot be
  // read or the header is malformed.
  static NdviRaster LoadAsciiGrid(const std::string &filename);

  // Throws OutOfBoundsError outside the extent or over a no-data pixel.
  double sampleAt(double lat, double lon) const;

  // Mean over `samples` evenly spaced points (minimum 2). Points that miss
  // the raster are skipped; throws OutOfBoundsError if all of them do.
  double sampleLine(const Polyline &line, int samples) const;

  bool contains(double lat, double lon) const;

  int cols() const { return cols_; }
  int rows() const { return rows_; }
  double cellSize() const { return cellSize_; }

private:
  int cols_;
  int rows_;
  double xll_; // west edge
  double yll_; // south edge
  double cellSize_;
  double nodata_;
  std::vector<float> values_; // row-major, row 0 = north

  bool lookup(double lat, double lon, double &value) const;
};

#endif // RASTER_HPP
