#include "pipeline.hpp"

#include <utility>

#include "classify.hpp"
#include "colocation.hpp"
#include "density.hpp"
#include "kdtree.hpp"

namespace sitedensity {

  AnalysisResult process_sites(std::vector<Site> sites, const AnalysisConfig &config) {
    config.validate();

    AnalysisResult result;
    if (sites.empty()) {
      result.messages.push_back("No valid rows after validation");
      return result;
    }

    kdtree::KDTree tree = kdtree::build_kdtree(site_points(sites));

    std::vector<double> density = density::estimate_density(tree, config.radius_km);
    for (size_t i = 0; i < sites.size(); i++) {
      sites[i].density = density[i];
    }

    std::vector<std::string> site_ids;
    site_ids.reserve(sites.size());
    for (const Site &site : sites) {
      site_ids.push_back(site.site_id);
    }
    colocation::CoLocationGrouper grouper(config.co_location_threshold_m);
    colocation::GroupAssignment groups = grouper.fit(tree, site_ids);
    for (size_t i = 0; i < sites.size(); i++) {
      sites[i].group_id = groups.group_ids[i];
      sites[i].group_size = groups.group_sizes[i];
    }

    std::vector<AreaClass> classes =
        classify::classify_sites(sites, config.classification_mode, config.classification_thresholds);
    for (size_t i = 0; i < sites.size(); i++) {
      sites[i].area_class = classes[i];
    }

    result.messages.push_back("Processed " + std::to_string(sites.size()) + " sites successfully");
    result.sites = std::move(sites);
    return result;
  }

  AnalysisResult process_table(const SiteTable &table, const AnalysisConfig &config) {
    config.validate();

    ValidatedSites validated = validate_sites(table);
    AnalysisResult result = process_sites(std::move(validated.sites), config);
    result.messages.insert(result.messages.begin(), validated.messages.begin(), validated.messages.end());
    return result;
  }

}  // namespace sitedensity
