#pragma once

#include <memory>
#include <vector>

#include <Eigen/Dense>

#include "geo_point_sources.hpp"

using Eigen::Vector3d;
using sitedensity::GeoPointSources;

namespace sitedensity {
  namespace kdtree {
    enum SplitDimension { X, Y, Z };

    SplitDimension next_dimension(SplitDimension dim);

    struct LeafNode {
      std::vector<int> ids;
      LeafNode(std::vector<int> ids);

      // Appends the ids whose unit vector lies within `chord` of `center`.
      void range_query(const std::vector<Vector3d> &xyz, const Vector3d &center, double chord,
                       std::vector<int> &out) const;
    };

    // A node of a kd-tree over points on the unit sphere. Each side of
    // the split holds either another KDNode or a LeafNode, never both.
    struct KDNode {
      SplitDimension dim;
      double split;

      std::unique_ptr<KDNode> left_kd;
      std::unique_ptr<LeafNode> left_leaf;

      std::unique_ptr<KDNode> right_kd;
      std::unique_ptr<LeafNode> right_leaf;

      KDNode(SplitDimension dim, const std::vector<Vector3d> &xyz, std::vector<int> ids, int max_leaf_size = 16);

      void range_query(const std::vector<Vector3d> &xyz, const Vector3d &center, double chord,
                       std::vector<int> &out) const;
    };

    /// @brief Exact radius search over geographic points.
    ///
    /// Points are projected to 3D unit vectors and split along X, Y
    /// and Z in turn. A query prunes subtrees by chord distance (which
    /// is monotone in great-circle distance) and then keeps only the
    /// candidates whose haversine distance is within the radius, so
    /// results never depend on the tree's shape.
    class KDTree {
      GeoPointSources points_;
      std::vector<Vector3d> xyz_;
      std::unique_ptr<KDNode> root_;

     public:
      KDTree(GeoPointSources points, int max_leaf_size = 16);

      /// @brief Indices of all points within `r_km` (inclusive) of
      /// (lat, lon), sorted ascending.
      std::vector<int> query_radius(double lat, double lon, double r_km) const;

      /// @brief query_radius around the n-th indexed point; the result
      /// includes n itself.
      std::vector<int> query_radius(int n, double r_km) const;

      const GeoPointSources &points() const { return points_; }
      const KDNode *root() const { return root_.get(); }
      int size() const;
    };

    KDTree build_kdtree(GeoPointSources points, int max_leaf_size = 16);
  }  // namespace kdtree
}  // namespace sitedensity
