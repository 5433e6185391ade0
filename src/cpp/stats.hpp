#pragma once

#include <vector>

namespace sitedensity {
  namespace stats {

    /// @brief The q-th quantile (0 <= q <= 1) of `values`, linearly
    /// interpolated between the two closest ranks at position
    /// q * (n - 1) of the sorted values.
    double quantile(const std::vector<double>& values, double q);

    // Same as quantile(), for values that are already sorted ascending.
    double sorted_quantile(const std::vector<double>& sorted, double q);

    struct Quartiles {
      double q25;
      double q50;
      double q75;
      Quartiles(const std::vector<double>& values);
    };
  }
}
