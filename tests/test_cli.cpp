#include <catch2/catch_test_macros.hpp>

#include <json/json.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "classify.hpp"
#include "cli.hpp"
#include "config.hpp"

using sitedensity::AnalysisConfig;
using sitedensity::CliOptions;
using sitedensity::UsageError;
using sitedensity::classify::ClassificationMode;

namespace fs = std::filesystem;
namespace sd = sitedensity;

static std::string temp_file(const std::string &name, const std::string &contents) {
  fs::path path = fs::temp_directory_path() / ("sitedensity_test_" + name);
  std::ofstream file(path, std::ios::binary);
  file << contents;
  return path.string();
}

static Json::Value parse_json(const std::string &text) {
  Json::CharReaderBuilder builder;
  Json::Value parsed;
  std::string errs;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  REQUIRE(reader->parse(text.data(), text.data() + text.size(), &parsed, &errs));
  return parsed;
}

static const std::string SITES_CSV = "site_id,lat,lon,cluster_id\nA,1,1,c\nB,1,1,c\nC,1.5,1.5,c\n";

TEST_CASE("parse command line", "[cli]") {
  SECTION("input only keeps defaults") {
    CliOptions options = sd::parse_cli_args({"sites.csv"});
    REQUIRE(options.input_path == "sites.csv");
    REQUIRE_FALSE(options.radius_km.has_value());
    REQUIRE_FALSE(options.co_location_threshold_m.has_value());
    REQUIRE_FALSE(options.mode.has_value());
    REQUIRE(options.preview_rows == 50);
    REQUIRE_FALSE(options.verbose);
  }

  SECTION("every option") {
    CliOptions options = sd::parse_cli_args({"--config", "a.yaml", "sites.csv", "--radius-km", "1.5",
                                             "--threshold-m", "250", "--mode", "threshold", "--output", "out.csv",
                                             "--report", "r.json", "--preview", "7", "--verbose"});
    REQUIRE(options.input_path == "sites.csv");
    REQUIRE(options.config_path == "a.yaml");
    REQUIRE(*options.radius_km == 1.5);
    REQUIRE(*options.co_location_threshold_m == 250.0);
    REQUIRE(*options.mode == "threshold");
    REQUIRE(options.output_path == "out.csv");
    REQUIRE(options.report_path == "r.json");
    REQUIRE(options.preview_rows == 7);
    REQUIRE(options.verbose);
  }

  SECTION("negative numbers are values, not options") {
    CliOptions options = sd::parse_cli_args({"sites.csv", "--radius-km", "-1"});
    REQUIRE(*options.radius_km == -1.0);
  }

  SECTION("help needs no input") {
    REQUIRE(sd::parse_cli_args({"--help"}).help);
  }
}

TEST_CASE("malformed numbers are usage errors", "[cli]") {
  REQUIRE_THROWS_AS(sd::parse_cli_args({"sites.csv", "--radius-km", "2km"}), UsageError);
  REQUIRE_THROWS_AS(sd::parse_cli_args({"sites.csv", "--radius-km", "abc"}), UsageError);
  REQUIRE_THROWS_AS(sd::parse_cli_args({"sites.csv", "--radius-km", "0x2"}), UsageError);
  REQUIRE_THROWS_AS(sd::parse_cli_args({"sites.csv", "--radius-km", ""}), UsageError);
  REQUIRE_THROWS_AS(sd::parse_cli_args({"sites.csv", "--threshold-m", "100m"}), UsageError);
  REQUIRE_THROWS_AS(sd::parse_cli_args({"sites.csv", "--preview", "abc"}), UsageError);
  REQUIRE_THROWS_AS(sd::parse_cli_args({"sites.csv", "--preview", "-1"}), UsageError);
  REQUIRE_THROWS_AS(sd::parse_cli_args({"sites.csv", "--preview", "3.5"}), UsageError);
}

TEST_CASE("malformed invocations are usage errors", "[cli]") {
  REQUIRE_THROWS_AS(sd::parse_cli_args({}), UsageError);
  REQUIRE_THROWS_AS(sd::parse_cli_args({"sites.csv", "--radius"}), UsageError);
  REQUIRE_THROWS_AS(sd::parse_cli_args({"sites.csv", "--radius-km"}), UsageError);
  REQUIRE_THROWS_AS(sd::parse_cli_args({"sites.csv", "other.csv"}), UsageError);
}

TEST_CASE("command line options override the config file", "[cli]") {
  std::string yaml = temp_file("override.yaml",
                               "radius_km: 5.0\n"
                               "co_location_threshold_m: 200\n"
                               "classification_mode: threshold\n");

  SECTION("file values without overrides") {
    AnalysisConfig config = sd::resolve_config(sd::parse_cli_args({"sites.csv", "--config", yaml}));
    REQUIRE(config.radius_km == 5.0);
    REQUIRE(config.co_location_threshold_m == 200.0);
    REQUIRE(config.classification_mode == ClassificationMode::Threshold);
  }

  SECTION("overrides win, the rest comes from the file") {
    AnalysisConfig config = sd::resolve_config(
        sd::parse_cli_args({"sites.csv", "--config", yaml, "--radius-km", "1.5", "--mode", "quantile"}));
    REQUIRE(config.radius_km == 1.5);
    REQUIRE(config.co_location_threshold_m == 200.0);
    REQUIRE(config.classification_mode == ClassificationMode::Quantile);
  }

  SECTION("overrides are validated") {
    REQUIRE_THROWS_AS(sd::resolve_config(sd::parse_cli_args({"sites.csv", "--radius-km", "0"})),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(sd::resolve_config(sd::parse_cli_args({"sites.csv", "--mode", "median"})),
                      std::invalid_argument);
  }
}

TEST_CASE("exit codes", "[cli]") {
  std::string csv = temp_file("sites.csv", SITES_CSV);
  std::ostringstream out;
  std::ostringstream err;

  SECTION("success prints the report") {
    REQUIRE(sd::run_cli({csv, "--preview", "2"}, out, err) == 0);
    Json::Value report = parse_json(out.str());
    REQUIRE(report["total_rows"].asInt() == 3);
    REQUIRE(report["preview"].size() == 2);
    REQUIRE(report["download_url"].isNull());
  }

  SECTION("help") {
    REQUIRE(sd::run_cli({"--help"}, out, err) == 0);
    REQUIRE(err.str().find("usage:") != std::string::npos);
  }

  SECTION("usage errors") {
    REQUIRE(sd::run_cli({csv, "--radius-km", "2km"}, out, err) == 2);
    REQUIRE(sd::run_cli({csv, "--preview", "abc"}, out, err) == 2);
    REQUIRE(sd::run_cli({}, out, err) == 2);
    REQUIRE(out.str().empty());
  }

  SECTION("configuration and I/O errors") {
    REQUIRE(sd::run_cli({csv, "--radius-km", "0"}, out, err) == 1);
    REQUIRE(sd::run_cli({csv, "--config", "/nonexistent/analysis.yaml"}, out, err) == 1);
    REQUIRE(sd::run_cli({"/nonexistent/sites.csv"}, out, err) == 1);
    REQUIRE(out.str().empty());
  }

  SECTION("report and enriched table go to files") {
    std::string report_path = temp_file("report.json", "");
    std::string output_path = temp_file("enriched.csv", "");
    REQUIRE(sd::run_cli({csv, "--report", report_path, "--output", output_path}, out, err) == 0);
    REQUIRE(out.str().empty());

    std::ifstream report_file(report_path);
    std::stringstream text;
    text << report_file.rdbuf();
    Json::Value report = parse_json(text.str());
    REQUIRE(report["download_url"].asString() == output_path);
    REQUIRE(report["summary"]["Rural"].asInt() + report["summary"]["Suburban"].asInt() +
                report["summary"]["Urban"].asInt() + report["summary"]["Dense"].asInt() ==
            3);
    REQUIRE(fs::file_size(output_path) > 0);
  }
}

TEST_CASE("byte-order mark on the input file", "[cli]") {
  std::string csv = temp_file("bom.csv", "\xEF\xBB\xBF" + SITES_CSV);
  std::ostringstream out;
  std::ostringstream err;
  REQUIRE(sd::run_cli({csv}, out, err) == 0);

  Json::Value report = parse_json(out.str());
  REQUIRE(report["total_rows"].asInt() == 3);
  REQUIRE(report["messages"].size() == 1);
  REQUIRE(report["messages"][0].asString() == "Processed 3 sites successfully");
}

TEST_CASE("each diagnostics message is logged once", "[cli]") {
  std::string csv = temp_file("dirty.csv",
                              "site_id,lat,lon,cluster_id\n"
                              "A,1,1,c\n"
                              "B,north,1,c\n"
                              "C,1,1.5,c\n");

  auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(128);
  sink->set_pattern("%v");
  spdlog::drop("sitedensity");
  spdlog::register_logger(std::make_shared<spdlog::logger>("sitedensity", sink));

  std::ostringstream out;
  std::ostringstream err;
  int code = sd::run_cli({csv}, out, err);
  std::vector<std::string> lines = sink->last_formatted();
  spdlog::drop("sitedensity");
  REQUIRE(code == 0);

  for (const std::string message :
       {"Dropped 1 rows with non-numeric lat", "Dropped 1 invalid rows (from 3 total)", "Processed 2 sites successfully"}) {
    int seen = 0;
    for (const std::string &line : lines) {
      if (line.find(message) != std::string::npos) {
        seen++;
      }
    }
    REQUIRE(seen == 1);
  }
}
