#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "kdtree.hpp"

namespace sitedensity {
  namespace colocation {

    // Undirected proximity link between two indexed points.
    struct Edge {
      int src;
      int dst;
      Edge(int src, int dst);
      bool operator<(const Edge &b) const;
      bool operator==(const Edge &b) const;
    };

    // Per-point results of CoLocationGrouper::fit, in index order.
    struct GroupAssignment {
      std::vector<std::string> group_ids;
      std::vector<int> group_sizes;
    };

    /// @brief 64-bit FNV-1a hash of `data`.
    std::uint64_t fnv1a_64(const std::string &data);

    /// @brief Content-derived identity of a co-location group.
    ///
    /// The member ids are sorted, each one is written as
    /// "<byte length>:<bytes>", and the concatenation is hashed with
    /// FNV-1a. The result is the hash as 16 lowercase hex digits, so a
    /// group gets the same id in every run and every process.
    std::string group_id(std::vector<std::string> member_site_ids);

    /// @brief Builds adjacency lists with every edge present in both
    /// directions exactly once. Self loops are dropped.
    std::vector<std::vector<int>> symmetric_adjacency(int n, const std::vector<Edge> &edges);

    /// @brief Connected components of an undirected graph, found with
    /// an explicit stack. Components are ordered by their smallest
    /// member and their members are sorted.
    std::vector<std::vector<int>> connected_components(const std::vector<std::vector<int>> &adjacency);

    /// @brief Groups points that are chained together by links shorter
    /// than a distance threshold.
    class CoLocationGrouper {
      double threshold_m;

     public:
      CoLocationGrouper(double threshold_m);

      /// @brief All pairs (i, j), i != j, whose haversine distance is
      /// strictly below the threshold, as returned by the index.
      std::vector<Edge> edges(const kdtree::KDTree &tree) const;

      /// @brief Assigns a group to every indexed point. `site_ids` is
      /// parallel to the points of `tree`.
      GroupAssignment fit(const kdtree::KDTree &tree, const std::vector<std::string> &site_ids) const;
    };

  }  // namespace colocation
}  // namespace sitedensity
