#include "classify.hpp"

#include <map>
#include <stdexcept>

#include "stats.hpp"

namespace sitedensity {
  namespace classify {

    ClassificationMode parse_mode(const std::string &mode) {
      if (mode == "quantile") {
        return ClassificationMode::Quantile;
      }
      if (mode == "threshold") {
        return ClassificationMode::Threshold;
      }
      throw std::invalid_argument("Invalid mode: " + mode + ". Must be 'quantile' or 'threshold'");
    }

    const char *mode_name(ClassificationMode mode) {
      switch (mode) {
        case ClassificationMode::Quantile:
          return "quantile";
        case ClassificationMode::Threshold:
          return "threshold";
      }
      throw std::invalid_argument("mode_name: unknown classification mode");
    }

    AreaClass bucket(double density, double rural, double suburban, double urban) {
      if (density <= rural) {
        return AreaClass::Rural;
      }
      if (density <= suburban) {
        return AreaClass::Suburban;
      }
      if (density <= urban) {
        return AreaClass::Urban;
      }
      return AreaClass::Dense;
    }

    std::vector<AreaClass> classify_quantile(const std::vector<double> &density,
                                             const std::vector<std::string> &cluster_ids) {
      if (density.size() != cluster_ids.size()) {
        throw std::invalid_argument("classify_quantile: density and cluster_ids must have the same length");
      }

      std::map<std::string, std::vector<size_t>> members;
      for (size_t i = 0; i < cluster_ids.size(); i++) {
        members[cluster_ids[i]].push_back(i);
      }

      std::vector<AreaClass> classes(density.size(), AreaClass::Rural);
      for (const auto &cluster : members) {
        std::vector<double> values;
        values.reserve(cluster.second.size());
        for (size_t i : cluster.second) {
          values.push_back(density[i]);
        }

        stats::Quartiles q(values);
        for (size_t i : cluster.second) {
          classes[i] = bucket(density[i], q.q25, q.q50, q.q75);
        }
      }
      return classes;
    }

    std::vector<AreaClass> classify_threshold(const std::vector<double> &density,
                                              const ClassificationThresholds &thresholds) {
      std::vector<AreaClass> classes;
      classes.reserve(density.size());
      for (double d : density) {
        classes.push_back(bucket(d, thresholds.rural, thresholds.suburban, thresholds.urban));
      }
      return classes;
    }

    std::vector<AreaClass> classify_sites(const std::vector<Site> &sites, ClassificationMode mode,
                                          const std::optional<ClassificationThresholds> &thresholds) {
      if (mode != ClassificationMode::Quantile && mode != ClassificationMode::Threshold) {
        throw std::invalid_argument("classify_sites: unknown classification mode");
      }

      std::vector<double> density;
      density.reserve(sites.size());
      for (const Site &site : sites) {
        if (!site.density.has_value()) {
          throw std::logic_error("classify_sites: site '" + site.site_id + "' has no density");
        }
        density.push_back(*site.density);
      }

      if (mode == ClassificationMode::Threshold) {
        return classify_threshold(density, thresholds.value_or(ClassificationThresholds{}));
      }

      std::vector<std::string> cluster_ids;
      cluster_ids.reserve(sites.size());
      for (const Site &site : sites) {
        cluster_ids.push_back(site.cluster_id);
      }
      return classify_quantile(density, cluster_ids);
    }

  }  // namespace classify
}  // namespace sitedensity
