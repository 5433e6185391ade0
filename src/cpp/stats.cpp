#include <vector>
#include <stdexcept>
#include <cmath>
#include <algorithm>
#include "stats.hpp"

using std::size_t;

using namespace sitedensity::stats;

double sitedensity::stats::sorted_quantile(const std::vector<double>& sorted, double q) {
  if (sorted.size() == 0) {
    throw std::invalid_argument("quantile: values is empty");
  }
  if (!(q >= 0 && q <= 1)) {
    throw std::invalid_argument("quantile: q must be within [0, 1]");
  }

  double pos = q * (sorted.size() - 1);
  size_t lo = (size_t) std::floor(pos);
  size_t hi = (size_t) std::ceil(pos);
  if (lo == hi) {
    return sorted[lo];
  }
  double frac = pos - lo;
  return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

double sitedensity::stats::quantile(const std::vector<double>& values, double q) {
  std::vector<double> vals = values;
  std::sort(vals.begin(), vals.end());
  return sorted_quantile(vals, q);
}

Quartiles::Quartiles(const std::vector<double>& values) {
  if (values.size() == 0) {
    throw std::invalid_argument("Cannot create a Quartiles object with no values");
  }
  std::vector<double> vals = values;
  std::sort(vals.begin(), vals.end());

  this->q25 = sorted_quantile(vals, 0.25);
  this->q50 = sorted_quantile(vals, 0.50);
  this->q75 = sorted_quantile(vals, 0.75);
}
