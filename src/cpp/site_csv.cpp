#include "site_csv.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>

namespace sitedensity {

  static const std::vector<std::string> REQUIRED_COLUMNS = {"site_id", "lat", "lon", "cluster_id"};

  // Cell contents that stand for a missing value.
  static const std::set<std::string> MISSING_MARKERS = {
      "",     "#N/A", "#N/A N/A", "#NA", "-1.#IND", "-1.#QNAN", "-NaN", "-nan", "1.#IND", "1.#QNAN",
      "<NA>", "N/A",  "NA",       "NULL", "NaN",    "None",     "n/a",  "nan",  "null"};

  static const std::string UTF8_BOM = "\xEF\xBB\xBF";

  int SiteTable::column_index(const std::string &column) const {
    auto it = std::find(columns.begin(), columns.end(), column);
    if (it == columns.end()) {
      return -1;
    }
    return it - columns.begin();
  }

  static std::vector<std::vector<std::string>> parse_records(const std::string &text) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool record_has_content = false;

    for (size_t i = 0; i < text.size(); i++) {
      char c = text[i];
      if (in_quotes) {
        if (c == '"') {
          if (i + 1 < text.size() && text[i + 1] == '"') {
            field += '"';
            i++;
          } else {
            in_quotes = false;
          }
        } else {
          field += c;
        }
        continue;
      }

      if (c == '"') {
        in_quotes = true;
        record_has_content = true;
      } else if (c == ',') {
        record.push_back(field);
        field.clear();
        record_has_content = true;
      } else if (c == '\n' || c == '\r') {
        if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
          i++;
        }
        if (record_has_content || !field.empty()) {
          record.push_back(field);
          records.push_back(record);
        }
        record.clear();
        field.clear();
        record_has_content = false;
      } else {
        field += c;
        record_has_content = true;
      }
    }

    if (in_quotes) {
      throw std::runtime_error("read_site_table: unterminated quoted field");
    }
    if (record_has_content || !field.empty()) {
      record.push_back(field);
      records.push_back(record);
    }
    return records;
  }

  SiteTable read_site_table(std::istream &in) {
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (text.compare(0, UTF8_BOM.size(), UTF8_BOM) == 0) {
      text.erase(0, UTF8_BOM.size());
    }
    std::vector<std::vector<std::string>> records = parse_records(text);

    SiteTable table;
    if (records.empty()) {
      return table;
    }
    table.columns = records[0];
    for (size_t i = 1; i < records.size(); i++) {
      std::vector<std::string> row = records[i];
      row.resize(table.columns.size());
      table.rows.push_back(row);
    }
    return table;
  }

  SiteTable read_site_table(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error("Could not open file " + path);
    }
    return read_site_table(file);
  }

  static bool is_missing(const std::string &cell) { return MISSING_MARKERS.count(cell) > 0; }

  // Strict number parse: surrounding whitespace is allowed, trailing
  // text is not. NaN and hex floats count as non-numeric.
  static bool parse_number(const std::string &cell, double &out) {
    const char *begin = cell.c_str();
    const char *digits = begin;
    while (*digits == ' ' || *digits == '\t') {
      digits++;
    }
    if (*digits == '+' || *digits == '-') {
      digits++;
    }
    if (digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
      return false;
    }
    char *end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin) {
      return false;
    }
    while (*end == ' ' || *end == '\t') {
      end++;
    }
    if (*end != '\0' || std::isnan(value)) {
      return false;
    }
    out = value;
    return true;
  }

  static std::string join_columns(const std::vector<std::string> &columns) {
    std::string joined = "[";
    for (size_t i = 0; i < columns.size(); i++) {
      if (i > 0) {
        joined += ", ";
      }
      joined += columns[i];
    }
    return joined + "]";
  }

  ValidatedSites validate_sites(const SiteTable &table) {
    ValidatedSites result;

    std::vector<std::string> missing_columns;
    for (const std::string &column : REQUIRED_COLUMNS) {
      if (table.column_index(column) < 0) {
        missing_columns.push_back(column);
      }
    }
    if (!missing_columns.empty()) {
      result.messages.push_back("Missing required columns: " + join_columns(missing_columns));
      return result;
    }

    int site_id_col = table.column_index("site_id");
    int lat_col = table.column_index("lat");
    int lon_col = table.column_index("lon");
    int cluster_col = table.column_index("cluster_id");

    // Rows still in play, with the coordinates parsed so far.
    struct Candidate {
      const std::vector<std::string> *row;
      double lat;
      double lon;
    };

    std::vector<Candidate> candidates;
    for (const auto &row : table.rows) {
      if (row.size() < table.columns.size()) {
        continue;
      }
      if (is_missing(row[site_id_col]) || is_missing(row[lat_col]) || is_missing(row[lon_col]) ||
          is_missing(row[cluster_col])) {
        continue;
      }
      candidates.push_back({&row, 0.0, 0.0});
    }

    // Coordinates are checked one column at a time, each pass over the
    // rows the previous pass kept.
    std::vector<Candidate> kept;
    for (Candidate &c : candidates) {
      if (parse_number((*c.row)[lat_col], c.lat)) {
        kept.push_back(c);
      }
    }
    if (kept.size() < candidates.size()) {
      result.messages.push_back(fmt::format("Dropped {} rows with non-numeric lat", candidates.size() - kept.size()));
    }
    candidates.swap(kept);
    kept.clear();

    for (Candidate &c : candidates) {
      if (parse_number((*c.row)[lon_col], c.lon)) {
        kept.push_back(c);
      }
    }
    if (kept.size() < candidates.size()) {
      result.messages.push_back(fmt::format("Dropped {} rows with non-numeric lon", candidates.size() - kept.size()));
    }
    candidates.swap(kept);

    size_t invalid_coords = 0;
    for (const Candidate &c : candidates) {
      if (c.lat < -90 || c.lat > 90 || c.lon < -180 || c.lon > 180) {
        invalid_coords++;
        continue;
      }
      const std::vector<std::string> &row = *c.row;
      Site site(row[site_id_col], c.lat, c.lon, row[cluster_col]);
      for (size_t col = 0; col < table.columns.size(); col++) {
        if ((int)col == site_id_col || (int)col == lat_col || (int)col == lon_col || (int)col == cluster_col) {
          continue;
        }
        site.passthrough.emplace_back(table.columns[col], row[col]);
      }
      result.sites.push_back(site);
    }
    if (invalid_coords > 0) {
      result.messages.push_back(fmt::format("Dropped {} rows with invalid coordinates", invalid_coords));
    }

    size_t dropped = table.rows.size() - result.sites.size();
    if (dropped > 0) {
      result.messages.push_back(fmt::format("Dropped {} invalid rows (from {} total)", dropped, table.rows.size()));
    }

    return result;
  }

  std::string format_number(double value) { return fmt::format("{}", value); }

  static std::string quote(const std::string &text) {
    std::string quoted = "\"";
    for (char c : text) {
      if (c == '"') {
        quoted += '"';
      }
      quoted += c;
    }
    return quoted + "\"";
  }

  void write_site_table(std::ostream &out, const std::vector<Site> &sites) {
    std::vector<std::string> header = REQUIRED_COLUMNS;
    if (!sites.empty()) {
      for (const auto &field : sites[0].passthrough) {
        header.push_back(field.first);
      }
    }
    header.insert(header.end(), {"density", "group_id", "group_size", "area_class"});

    for (size_t i = 0; i < header.size(); i++) {
      out << (i > 0 ? "," : "") << quote(header[i]);
    }
    out << '\n';

    for (const Site &site : sites) {
      out << quote(site.site_id) << ',' << format_number(site.lat) << ',' << format_number(site.lon) << ','
          << quote(site.cluster_id);
      for (const auto &field : site.passthrough) {
        out << ',' << quote(field.second);
      }
      out << ',' << (site.density ? format_number(*site.density) : "");
      out << ',' << (site.group_id ? quote(*site.group_id) : "");
      out << ',' << (site.group_size ? std::to_string(*site.group_size) : "");
      out << ',' << (site.area_class ? quote(area_class_name(*site.area_class)) : "");
      out << '\n';
    }
  }

  void write_site_table(const std::string &path, const std::vector<Site> &sites) {
    std::ofstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error("Could not open file " + path + " for writing");
    }
    write_site_table(file, sites);
    if (!file) {
      throw std::runtime_error("Failed writing " + path);
    }
  }

}  // namespace sitedensity
