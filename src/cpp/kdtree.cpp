#include "kdtree.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

#include "projections.hpp"

using Eigen::Vector3d;
using sitedensity::GeoPointSources;
using namespace sitedensity::kdtree;

namespace sp = sitedensity::projections;

// Widens the pruning chord so that rounding in the projection can never
// drop a point that the haversine filter would accept.
static double padded_chord(double chord) { return chord * (1 + 1e-9) + 1e-12; }

LeafNode::LeafNode(std::vector<int> ids) { this->ids = std::move(ids); }

void LeafNode::range_query(const std::vector<Vector3d> &xyz, const Vector3d &center, double chord,
                           std::vector<int> &out) const {
  double chord_sq = chord * chord;
  for (int id : this->ids) {
    if ((xyz[id] - center).squaredNorm() <= chord_sq) {
      out.push_back(id);
    }
  }
}

KDNode::KDNode(SplitDimension dim, const std::vector<Vector3d> &xyz, std::vector<int> ids, int max_leaf_size) {
  this->dim = dim;

  // Median split by position, not by value, so duplicate coordinates
  // still halve the node and the depth stays logarithmic.
  size_t mid = ids.size() / 2;
  std::nth_element(ids.begin(), ids.begin() + mid, ids.end(),
                   [&xyz, dim](int a, int b) { return xyz[a](dim) < xyz[b](dim); });
  this->split = xyz[ids[mid]](dim);

  std::vector<int> left_ids(ids.begin(), ids.begin() + mid);
  std::vector<int> right_ids(ids.begin() + mid, ids.end());

  SplitDimension next_dim = next_dimension(dim);

  if ((int)left_ids.size() <= max_leaf_size) {
    this->left_leaf = std::make_unique<LeafNode>(std::move(left_ids));
  } else {
    this->left_kd = std::make_unique<KDNode>(next_dim, xyz, std::move(left_ids), max_leaf_size);
  }

  if ((int)right_ids.size() <= max_leaf_size) {
    this->right_leaf = std::make_unique<LeafNode>(std::move(right_ids));
  } else {
    this->right_kd = std::make_unique<KDNode>(next_dim, xyz, std::move(right_ids), max_leaf_size);
  }
}

void KDNode::range_query(const std::vector<Vector3d> &xyz, const Vector3d &center, double chord,
                         std::vector<int> &out) const {
  // Left holds coordinates <= split, right holds coordinates >= split.
  if (center(this->dim) - chord <= this->split) {
    if (this->left_leaf != nullptr) {
      this->left_leaf->range_query(xyz, center, chord, out);
    } else {
      this->left_kd->range_query(xyz, center, chord, out);
    }
  }
  if (center(this->dim) + chord >= this->split) {
    if (this->right_leaf != nullptr) {
      this->right_leaf->range_query(xyz, center, chord, out);
    } else {
      this->right_kd->range_query(xyz, center, chord, out);
    }
  }
}

KDTree::KDTree(GeoPointSources points, int max_leaf_size) : points_(std::move(points)) {
  if (max_leaf_size < 1) {
    throw std::invalid_argument("KDTree: max_leaf_size must be at least 1");
  }
  int n = this->points_.size();
  this->xyz_.reserve(n);
  for (int i = 0; i < n; i++) {
    this->xyz_.push_back(sp::unit_vector(this->points_.lat[i], this->points_.lon[i]));
  }
  if (n == 0) {
    return;
  }

  std::vector<int> ids(n);
  for (int i = 0; i < n; i++) {
    ids[i] = i;
  }
  this->root_ = std::make_unique<KDNode>(SplitDimension::X, this->xyz_, std::move(ids), max_leaf_size);
}

std::vector<int> KDTree::query_radius(double lat, double lon, double r_km) const {
  if (r_km < 0) {
    throw std::invalid_argument("KDTree::query_radius: r_km must be non-negative");
  }
  std::vector<int> result;
  if (this->root_ == nullptr) {
    return result;
  }

  std::vector<int> candidates;
  this->root_->range_query(this->xyz_, sp::unit_vector(lat, lon), padded_chord(sp::chord_length(r_km)), candidates);

  result.reserve(candidates.size());
  for (int id : candidates) {
    if (sp::haversine_km(lat, lon, this->points_.lat[id], this->points_.lon[id]) <= r_km) {
      result.push_back(id);
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::vector<int> KDTree::query_radius(int n, double r_km) const {
  if (n < 0 || n >= this->size()) {
    throw std::out_of_range("KDTree::query_radius: n is out of range");
  }
  return this->query_radius(this->points_.lat[n], this->points_.lon[n], r_km);
}

int KDTree::size() const { return this->points_.size(); }

namespace sitedensity {
  namespace kdtree {

    SplitDimension next_dimension(SplitDimension dim) {
      switch (dim) {
        case SplitDimension::X:
          return SplitDimension::Y;
        case SplitDimension::Y:
          return SplitDimension::Z;
        default:
          return SplitDimension::X;
      }
    }

    KDTree build_kdtree(GeoPointSources points, int max_leaf_size) { return KDTree(std::move(points), max_leaf_size); }

  }  // namespace kdtree
}  // namespace sitedensity
