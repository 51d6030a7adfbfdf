#ifndef COST_MODEL_HPP
#define COST_MODEL_HPP

#include "types.hpp"
#include <string>

// How greenness becomes a cost. Both are decreasing in NDVI and
// non-negative over [-1, 1].
enum class NdviTransform {
  kNormalized, // length * (1 - (ndvi + 1) / 2)
  kLinear      // length * (1 - ndvi)
};

std::string ndviTransformToString(NdviTransform t);
// Throws std::invalid_argument on an unknown name.
NdviTransform ndviTransformFromString(const std::string &name);

struct CostConfig {
  double greenWeight = DEFAULT_GREEN_WEIGHT; // w1
  double aqiWeight = DEFAULT_AQI_WEIGHT;     // w2
  double aqiScale = DEFAULT_AQI_SCALE;
  NdviTransform ndviTransform = NdviTransform::kNormalized;
};

class CostModel {
public:
  // Throws std::invalid_argument on negative weights or a non-positive
  // aqiScale. The weights are not required to sum to 1.
  explicit CostModel(const CostConfig &config = CostConfig());

  double ndviCost(double ndvi, double length) const;
  double aqiCost(double aqi, double length) const;

  double distanceWeight(const EdgeAttributes &attrs) const {
    return attrs.length;
  }
  double greenCost(const EdgeAttributes &attrs) const;

  const CostConfig &config() const { return config_; }

private:
  CostConfig config_;
};

#endif // COST_MODEL_HPP
