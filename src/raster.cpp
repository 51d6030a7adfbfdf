#include "raster.hpp"
#include "errors.hpp"
#include "geometry.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

NdviRaster::NdviRaster(int cols, int rows, double xllcorner, double yllcorner,
                       double cellSize, std::vector<float> values,
                       double nodata)
    : cols_(cols), rows_(rows), xll_(xllcorner), yll_(yllcorner),
      cellSize_(cellSize), nodata_(nodata), values_(std::move(values)) {
  if (cols_ <= 0 || rows_ <= 0 || cellSize_ <= 0.0)
    throw EnrichmentError("Raster has an empty extent");
  if (values_.size() != (size_t)cols_ * (size_t)rows_)
    throw EnrichmentError("Raster holds " + std::to_string(values_.size()) +
                          " values, expected " +
                          std::to_string((size_t)cols_ * (size_t)rows_));
}

NdviRaster NdviRaster::LoadAsciiGrid(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open())
    throw EnrichmentError("NDVI raster not found: " + filename);

  std::cout << "[Raster] Loading NDVI grid from " << filename << "..."
            << std::endl;

  int cols = -1, rows = -1;
  double xll = 0.0, yll = 0.0, cellSize = -1.0, nodata = -9999.0;
  bool xCenter = false, yCenter = false;
  bool haveX = false, haveY = false;

  // Header: "key value" lines until the first numeric row
  std::string token;
  std::streampos dataStart = file.tellg();
  while (file >> token) {
    std::string key = token;
    std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
    if (!key.empty() && (std::isdigit((unsigned char)key[0]) || key[0] == '-' ||
                         key[0] == '+' || key[0] == '.' || key == "nan")) {
      file.clear();
      file.seekg(dataStart);
      break;
    }

    double value = 0.0;
    if (!(file >> value))
      throw EnrichmentError("Malformed raster header near '" + token +
                            "' in " + filename);
    if (key == "ncols")
      cols = (int)value;
    else if (key == "nrows")
      rows = (int)value;
    else if (key == "xllcorner" || key == "xllcenter") {
      xll = value;
      xCenter = key == "xllcenter";
      haveX = true;
    } else if (key == "yllcorner" || key == "yllcenter") {
      yll = value;
      yCenter = key == "yllcenter";
      haveY = true;
    } else if (key == "cellsize")
      cellSize = value;
    else if (key == "nodata_value")
      nodata = value;
    else
      throw EnrichmentError("Unknown raster header key '" + token + "' in " +
                            filename);
    dataStart = file.tellg();
  }

  if (cols <= 0 || rows <= 0 || cellSize <= 0.0 || !haveX || !haveY)
    throw EnrichmentError("Incomplete raster header in " + filename);
  if (xCenter)
    xll -= cellSize / 2.0;
  if (yCenter)
    yll -= cellSize / 2.0;

  std::vector<float> values;
  values.reserve((size_t)cols * (size_t)rows);
  std::string cell;
  while (file >> cell) {
    try {
      values.push_back(std::stof(cell));
    } catch (const std::invalid_argument &) {
      throw EnrichmentError("Non-numeric raster cell '" + cell + "' in " +
                            filename);
    } catch (const std::out_of_range &) {
      values.push_back((float)nodata);
    }
  }

  NdviRaster raster(cols, rows, xll, yll, cellSize, std::move(values), nodata);
  std::cout << "[Raster] Loaded " << cols << "x" << rows << " grid, cell "
            << cellSize << " deg." << std::endl;
  return raster;
}

bool NdviRaster::contains(double lat, double lon) const {
  return lon >= xll_ && lon < xll_ + cols_ * cellSize_ && lat > yll_ &&
         lat <= yll_ + rows_ * cellSize_;
}

bool NdviRaster::lookup(double lat, double lon, double &value) const {
  if (!contains(lat, lon))
    return false;

  int col = (int)std::floor((lon - xll_) / cellSize_);
  int row = (int)std::floor((yll_ + rows_ * cellSize_ - lat) / cellSize_);
  col = std::max(0, std::min(cols_ - 1, col));
  row = std::max(0, std::min(rows_ - 1, row));

  float pixel = values_[(size_t)row * cols_ + col];
  if (std::isnan(pixel) || pixel == (float)nodata_)
    return false;
  value = pixel;
  return true;
}

double NdviRaster::sampleAt(double lat, double lon) const {
  double value = 0.0;
  if (!lookup(lat, lon, value))
    throw OutOfBoundsError(lat, lon,
                           contains(lat, lon) ? "no data"
                                              : "outside raster extent");
  return value;
}

double NdviRaster::sampleLine(const Polyline &line, int samples) const {
  if (line.empty())
    throw OutOfBoundsError(0.0, 0.0, "empty geometry");

  double sum = 0.0;
  int hits = 0;
  for (const auto &p : samplePoints(line, samples)) {
    double value = 0.0;
    if (lookup(p.lat, p.lon, value)) {
      sum += value;
      hits++;
    }
  }
  if (hits == 0) {
    const Coordinate mid = midpoint(line);
    throw OutOfBoundsError(mid.lat, mid.lon, "no sample on valid pixels");
  }
  return sum / hits;
}
