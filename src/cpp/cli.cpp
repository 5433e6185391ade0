#include "cli.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <memory>

#include "pipeline.hpp"
#include "report.hpp"
#include "site_csv.hpp"

namespace sitedensity {

  static double parse_double_arg(const std::string &option, const std::string &value) {
    // Decimal only: std::stod would also take hex and stop at "2km".
    bool hex = value.find_first_of("xX") != std::string::npos;
    size_t used = 0;
    double parsed = 0.0;
    try {
      parsed = std::stod(value, &used);
    } catch (const std::logic_error &) {
      used = 0;
    }
    if (hex || used == 0 || used != value.size()) {
      throw UsageError(option + " expects a number, got '" + value + "'");
    }
    return parsed;
  }

  static std::size_t parse_count_arg(const std::string &option, const std::string &value) {
    size_t used = 0;
    unsigned long parsed = 0;
    // std::stoul accepts "-1" and wraps it.
    if (!value.empty() && value[0] >= '0' && value[0] <= '9') {
      try {
        parsed = std::stoul(value, &used, 10);
      } catch (const std::logic_error &) {
        used = 0;
      }
    }
    if (used == 0 || used != value.size()) {
      throw UsageError(option + " expects a non-negative integer, got '" + value + "'");
    }
    return parsed;
  }

  CliOptions parse_cli_args(const std::vector<std::string> &args) {
    CliOptions options;
    for (size_t i = 0; i < args.size(); i++) {
      const std::string &a = args[i];
      bool has_value = i + 1 < args.size();
      if (a == "--help" || a == "-h") {
        options.help = true;
      } else if (a == "--verbose") {
        options.verbose = true;
      } else if (a == "--config" && has_value) {
        options.config_path = args[++i];
      } else if (a == "--radius-km" && has_value) {
        options.radius_km = parse_double_arg(a, args[++i]);
      } else if (a == "--threshold-m" && has_value) {
        options.co_location_threshold_m = parse_double_arg(a, args[++i]);
      } else if (a == "--mode" && has_value) {
        options.mode = args[++i];
      } else if (a == "--output" && has_value) {
        options.output_path = args[++i];
      } else if (a == "--report" && has_value) {
        options.report_path = args[++i];
      } else if (a == "--preview" && has_value) {
        options.preview_rows = parse_count_arg(a, args[++i]);
      } else if (!a.empty() && a[0] != '-' && options.input_path.empty()) {
        options.input_path = a;
      } else if (!a.empty() && a[0] == '-') {
        throw UsageError("unknown option or missing value: " + a);
      } else {
        throw UsageError("unexpected argument: " + a);
      }
    }
    if (options.input_path.empty() && !options.help) {
      throw UsageError("missing input path");
    }
    return options;
  }

  AnalysisConfig resolve_config(const CliOptions &options) {
    AnalysisConfig config;
    if (!options.config_path.empty()) {
      config = load_analysis_config(options.config_path);
    }
    if (options.radius_km) {
      config.radius_km = *options.radius_km;
    }
    if (options.co_location_threshold_m) {
      config.co_location_threshold_m = *options.co_location_threshold_m;
    }
    if (options.mode) {
      config.classification_mode = classify::parse_mode(*options.mode);
    }
    config.validate();
    return config;
  }

  void print_usage(std::ostream &err) {
    err << "usage: sitedensity <input.csv> [--config analysis.yaml] [--radius-km X] [--threshold-m X]\n"
           "       [--mode quantile|threshold] [--output enriched.csv] [--report report.json]\n"
           "       [--preview N] [--verbose]\n";
  }

  // The tool logs to stderr; stdout carries the JSON report.
  static void setup_logging(bool verbose) {
    std::shared_ptr<spdlog::logger> logger = spdlog::get("sitedensity");
    if (!logger) {
      logger = spdlog::stderr_color_mt("sitedensity");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  }

  int run_cli(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    CliOptions options;
    try {
      options = parse_cli_args(args);
    } catch (const UsageError &e) {
      err << "sitedensity: " << e.what() << "\n";
      print_usage(err);
      return 2;
    }
    if (options.help) {
      print_usage(err);
      return 0;
    }

    setup_logging(options.verbose);

    try {
      AnalysisConfig config = resolve_config(options);
      spdlog::debug("radius_km={} co_location_threshold_m={} classification_mode={}", config.radius_km,
                    config.co_location_threshold_m, classify::mode_name(config.classification_mode));

      auto start = std::chrono::steady_clock::now();
      SiteTable table = read_site_table(options.input_path);
      spdlog::debug("read {} rows from {}", table.rows.size(), options.input_path);

      AnalysisResult result = process_table(table, config);
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
      spdlog::debug("analysis took {} ms", elapsed.count());

      for (const std::string &message : result.messages) {
        spdlog::info("{}", message);
      }

      AnalysisResponse response = build_response(result, options.preview_rows);
      spdlog::info("Rural={} Suburban={} Urban={} Dense={}", response.summary.rural, response.summary.suburban,
                   response.summary.urban, response.summary.dense);

      if (!options.output_path.empty()) {
        write_site_table(options.output_path, result.sites);
        spdlog::info("wrote {} sites to {}", result.sites.size(), options.output_path);
        response.download_url = options.output_path;
      }
      std::string json = render_json(response);
      if (options.report_path.empty()) {
        out << json << std::endl;
      } else {
        std::ofstream report(options.report_path);
        if (!report.is_open()) {
          throw std::runtime_error("Could not open file " + options.report_path + " for writing");
        }
        report << json << '\n';
      }
    } catch (const std::exception &e) {
      spdlog::error("{}", e.what());
      return 1;
    }
    return 0;
  }

}  // namespace sitedensity
