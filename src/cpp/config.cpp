#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <stdexcept>

namespace sitedensity {

  static const double MIN_RADIUS_KM = 0.1;
  static const double MAX_RADIUS_KM = 100.0;
  static const double MIN_THRESHOLD_M = 1.0;
  static const double MAX_THRESHOLD_M = 10000.0;

  void AnalysisConfig::validate() const {
    if (!(radius_km >= MIN_RADIUS_KM && radius_km <= MAX_RADIUS_KM)) {
      throw std::invalid_argument("radius_km must be within [0.1, 100], got " + std::to_string(radius_km));
    }
    if (!(co_location_threshold_m >= MIN_THRESHOLD_M && co_location_threshold_m <= MAX_THRESHOLD_M)) {
      throw std::invalid_argument("co_location_threshold_m must be within [1, 10000], got " +
                                  std::to_string(co_location_threshold_m));
    }
    // Also rejects modes that were forced in by a cast.
    classify::mode_name(classification_mode);

    if (classification_thresholds) {
      const classify::ClassificationThresholds &t = *classification_thresholds;
      if (!std::isfinite(t.rural) || !std::isfinite(t.suburban) || !std::isfinite(t.urban)) {
        throw std::invalid_argument("classification_thresholds must be finite");
      }
      if (t.rural > t.suburban || t.suburban > t.urban) {
        throw std::invalid_argument("classification_thresholds must satisfy rural <= suburban <= urban");
      }
    }
  }

  static AnalysisConfig from_yaml(const YAML::Node &y) {
    AnalysisConfig cfg;
    if (!y || y.IsNull()) {
      return cfg;
    }
    if (!y.IsMap()) {
      throw std::invalid_argument("analysis config must be a YAML mapping");
    }

    if (y["radius_km"]) cfg.radius_km = y["radius_km"].as<double>();
    if (y["co_location_threshold_m"]) cfg.co_location_threshold_m = y["co_location_threshold_m"].as<double>();
    if (y["classification_mode"]) {
      cfg.classification_mode = classify::parse_mode(y["classification_mode"].as<std::string>());
    }

    if (auto t = y["classification_thresholds"]) {
      if (!t.IsNull()) {
        if (!t.IsMap()) {
          throw std::invalid_argument("classification_thresholds must be a mapping of rural/suburban/urban");
        }
        classify::ClassificationThresholds thresholds;
        if (t["rural"])    thresholds.rural    = t["rural"].as<double>();
        if (t["suburban"]) thresholds.suburban = t["suburban"].as<double>();
        if (t["urban"])    thresholds.urban    = t["urban"].as<double>();
        cfg.classification_thresholds = thresholds;
      }
    }
    return cfg;
  }

  AnalysisConfig load_analysis_config(const std::string &path) {
    YAML::Node y;
    try {
      y = YAML::LoadFile(path);
    } catch (const YAML::BadFile &) {
      throw std::runtime_error("Could not open config file " + path);
    }
    AnalysisConfig cfg = from_yaml(y);
    cfg.validate();
    return cfg;
  }

  AnalysisConfig parse_analysis_config(const std::string &yaml_text) {
    AnalysisConfig cfg = from_yaml(YAML::Load(yaml_text));
    cfg.validate();
    return cfg;
  }

}  // namespace sitedensity
