#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "site.hpp"

namespace sitedensity {

  // A comma separated table, as read: a header and untyped cells.
  struct SiteTable {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;

    // Index of `column` in the header, or -1.
    int column_index(const std::string &column) const;
  };

  /// @brief Parses CSV text with a header row. Fields may be wrapped in
  /// double quotes, with "" standing for a literal quote; quoted fields
  /// may span lines. Throws std::runtime_error on an unterminated quote.
  SiteTable read_site_table(std::istream &in);
  SiteTable read_site_table(const std::string &path);

  // Sites that passed validation, and one message per kind of drop.
  struct ValidatedSites {
    std::vector<Site> sites;
    std::vector<std::string> messages;
  };

  /// @brief Turns table rows into typed sites, dropping rows with a
  /// missing required field, a non-numeric coordinate or a coordinate
  /// out of geographic bounds. Columns other than site_id, lat, lon and
  /// cluster_id are kept as passthrough fields.
  ValidatedSites validate_sites(const SiteTable &table);

  /// @brief Writes sites as CSV: the required columns, passthrough
  /// columns, then density, group_id, group_size and area_class. Text
  /// is quoted, numbers are not, and fields that were never computed
  /// are left empty.
  void write_site_table(std::ostream &out, const std::vector<Site> &sites);
  void write_site_table(const std::string &path, const std::vector<Site> &sites);

  // Shortest decimal text that reads back as exactly `value`.
  std::string format_number(double value);

}  // namespace sitedensity
