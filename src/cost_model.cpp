#include "cost_model.hpp"
#include <cmath>
#include <stdexcept>

std::string ndviTransformToString(NdviTransform t) {
  switch (t) {
  case NdviTransform::kNormalized:
    return "normalized";
  case NdviTransform::kLinear:
    return "linear";
  }
  return "unknown";
}

NdviTransform ndviTransformFromString(const std::string &name) {
  if (name == "normalized")
    return NdviTransform::kNormalized;
  if (name == "linear")
    return NdviTransform::kLinear;
  throw std::invalid_argument("Unknown NDVI transform: " + name);
}

CostModel::CostModel(const CostConfig &config) : config_(config) {
  if (!std::isfinite(config_.greenWeight) ||
      !std::isfinite(config_.aqiWeight))
    throw std::invalid_argument("Cost weights must be finite");
  if (config_.greenWeight < 0.0 || config_.aqiWeight < 0.0)
    throw std::invalid_argument("Cost weights must be non-negative");
  if (!std::isfinite(config_.aqiScale) || config_.aqiScale <= 0.0)
    throw std::invalid_argument("AQI scale must be positive and finite");
}

double CostModel::ndviCost(double ndvi, double length) const {
  ndvi = clampNdvi(ndvi);
  switch (config_.ndviTransform) {
  case NdviTransform::kLinear:
    return length * (1.0 - ndvi);
  case NdviTransform::kNormalized:
    break;
  }
  double ndviNorm = (ndvi + 1.0) / 2.0;
  return length * (1.0 - ndviNorm);
}

double CostModel::aqiCost(double aqi, double length) const {
  if (aqi < 0.0)
    aqi = 0.0;
  return length * (1.0 + aqi / config_.aqiScale);
}

double CostModel::greenCost(const EdgeAttributes &attrs) const {
  return config_.greenWeight * ndviCost(attrs.ndvi, attrs.length) +
         config_.aqiWeight * aqiCost(attrs.aqi, attrs.length);
}
