#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hpp"

namespace sitedensity {

  // Bad command line: unknown option, missing value, malformed number.
  class UsageError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
  };

  // Options as given on the command line. Unset overrides leave the
  // YAML (or default) value in place.
  struct CliOptions {
    std::string input_path;
    std::string config_path;
    std::string output_path;
    std::string report_path;
    std::optional<double> radius_km;
    std::optional<double> co_location_threshold_m;
    std::optional<std::string> mode;
    std::size_t preview_rows{50};
    bool verbose{false};
    bool help{false};
  };

  /// @brief Parses arguments (without the program name). Throws
  /// UsageError on anything that is not a well formed invocation.
  CliOptions parse_cli_args(const std::vector<std::string> &args);

  /// @brief Loads the YAML config if one was given, applies the command
  /// line overrides on top and validates the result.
  AnalysisConfig resolve_config(const CliOptions &options);

  /// @brief Runs the command line tool. The JSON report goes to `out`
  /// unless --report names a file; usage text goes to `err`.
  ///
  /// Returns 0 on success, 1 on configuration or I/O errors and 2 on
  /// usage errors.
  int run_cli(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);

  void print_usage(std::ostream &err);

}  // namespace sitedensity
