#include "colocation.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "projections.hpp"

namespace sp = sitedensity::projections;

namespace sitedensity {
  namespace colocation {

    static const std::uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
    static const std::uint64_t FNV_PRIME = 1099511628211ULL;

    Edge::Edge(int src, int dst) : src(src), dst(dst) {}

    bool Edge::operator<(const Edge &b) const {
      if (src != b.src) {
        return src < b.src;
      }
      return dst < b.dst;
    }

    bool Edge::operator==(const Edge &b) const { return src == b.src && dst == b.dst; }

    std::uint64_t fnv1a_64(const std::string &data) {
      std::uint64_t hash = FNV_OFFSET_BASIS;
      for (unsigned char c : data) {
        hash ^= c;
        hash *= FNV_PRIME;
      }
      return hash;
    }

    std::string group_id(std::vector<std::string> member_site_ids) {
      std::sort(member_site_ids.begin(), member_site_ids.end());

      // Length prefixes keep ["ab", "c"] and ["a", "bc"] apart.
      std::string key;
      for (const std::string &id : member_site_ids) {
        key += std::to_string(id.size());
        key += ':';
        key += id;
      }

      return fmt::format("{:016x}", fnv1a_64(key));
    }

    std::vector<std::vector<int>> symmetric_adjacency(int n, const std::vector<Edge> &edges) {
      std::vector<Edge> both;
      both.reserve(edges.size() * 2);
      for (const Edge &e : edges) {
        if (e.src < 0 || e.src >= n || e.dst < 0 || e.dst >= n) {
          throw std::out_of_range("symmetric_adjacency: edge endpoint is out of range");
        }
        if (e.src == e.dst) {
          continue;
        }
        both.emplace_back(e.src, e.dst);
        both.emplace_back(e.dst, e.src);
      }
      std::sort(both.begin(), both.end());
      both.erase(std::unique(both.begin(), both.end()), both.end());

      std::vector<std::vector<int>> adjacency(n);
      for (const Edge &e : both) {
        adjacency[e.src].push_back(e.dst);
      }
      return adjacency;
    }

    std::vector<std::vector<int>> connected_components(const std::vector<std::vector<int>> &adjacency) {
      int n = adjacency.size();
      std::vector<bool> visited(n, false);
      std::vector<std::vector<int>> components;
      std::vector<int> stack;

      for (int i = 0; i < n; i++) {
        if (visited[i]) {
          continue;
        }

        // New component
        std::vector<int> component;
        visited[i] = true;
        stack.push_back(i);
        while (!stack.empty()) {
          int p = stack.back();
          stack.pop_back();
          component.push_back(p);
          for (int q : adjacency[p]) {
            if (!visited[q]) {
              visited[q] = true;
              stack.push_back(q);
            }
          }
        }

        std::sort(component.begin(), component.end());
        components.push_back(component);
      }
      return components;
    }

    CoLocationGrouper::CoLocationGrouper(double threshold_m) {
      if (!(threshold_m > 0)) {
        throw std::invalid_argument("CoLocationGrouper: threshold_m must be positive");
      }
      this->threshold_m = threshold_m;
    }

    std::vector<Edge> CoLocationGrouper::edges(const kdtree::KDTree &tree) const {
      double threshold_km = this->threshold_m / 1000.0;
      const GeoPointSources &points = tree.points();

      std::vector<Edge> edges;
      for (int i = 0; i < tree.size(); i++) {
        std::vector<int> neighbors = tree.query_radius(i, threshold_km);
        for (int j : neighbors) {
          if (j == i) {
            continue;
          }
          // The index is inclusive; links are strict.
          double d = sp::haversine_km(points.lat[i], points.lon[i], points.lat[j], points.lon[j]);
          if (d < threshold_km) {
            edges.emplace_back(i, j);
          }
        }
      }
      return edges;
    }

    GroupAssignment CoLocationGrouper::fit(const kdtree::KDTree &tree, const std::vector<std::string> &site_ids) const {
      if ((int)site_ids.size() != tree.size()) {
        throw std::invalid_argument("CoLocationGrouper::fit: site_ids must match the indexed points");
      }
      int n = tree.size();

      std::vector<std::vector<int>> adjacency = symmetric_adjacency(n, this->edges(tree));
      std::vector<std::vector<int>> components = connected_components(adjacency);

      GroupAssignment result;
      result.group_ids.resize(n);
      result.group_sizes.resize(n);

      for (const std::vector<int> &component : components) {
        std::vector<std::string> members;
        members.reserve(component.size());
        for (int i : component) {
          members.push_back(site_ids[i]);
        }

        std::string id = group_id(members);
        for (int i : component) {
          result.group_ids[i] = id;
        }
      }

      // Sizes follow the id, so components with identical member ids
      // (possible when site ids repeat) report their combined count.
      std::unordered_map<std::string, int> counts;
      for (const std::string &id : result.group_ids) {
        counts[id]++;
      }
      for (int i = 0; i < n; i++) {
        result.group_sizes[i] = counts[result.group_ids[i]];
      }
      return result;
    }

  }  // namespace colocation
}  // namespace sitedensity
