#include "report.hpp"

#include <algorithm>

namespace sitedensity {

  AnalysisSummary summarize(const std::vector<Site> &sites) {
    AnalysisSummary summary;
    for (const Site &site : sites) {
      if (!site.area_class) {
        continue;
      }
      switch (*site.area_class) {
        case AreaClass::Rural:
          summary.rural++;
          break;
        case AreaClass::Suburban:
          summary.suburban++;
          break;
        case AreaClass::Urban:
          summary.urban++;
          break;
        case AreaClass::Dense:
          summary.dense++;
          break;
      }
    }
    return summary;
  }

  std::vector<Site> preview(const std::vector<Site> &sites, std::size_t max_rows) {
    std::size_t n = std::min(max_rows, sites.size());
    return std::vector<Site>(sites.begin(), sites.begin() + n);
  }

  AnalysisResponse build_response(const AnalysisResult &result, std::size_t preview_rows) {
    AnalysisResponse response;
    response.summary = summarize(result.sites);
    response.preview = preview(result.sites, preview_rows);
    response.total_rows = result.sites.size();
    response.messages = result.messages;
    return response;
  }

  Json::Value to_json(const AnalysisSummary &summary) {
    Json::Value root;
    root["Rural"] = summary.rural;
    root["Suburban"] = summary.suburban;
    root["Urban"] = summary.urban;
    root["Dense"] = summary.dense;
    return root;
  }

  Json::Value to_json(const Site &site) {
    Json::Value row;
    row["site_id"] = site.site_id;
    row["lat"] = site.lat;
    row["lon"] = site.lon;
    row["cluster_id"] = site.cluster_id;
    for (const auto &field : site.passthrough) {
      row[field.first] = field.second;
    }
    row["density"] = site.density ? Json::Value(*site.density) : Json::Value(Json::nullValue);
    row["group_id"] = site.group_id ? Json::Value(*site.group_id) : Json::Value(Json::nullValue);
    row["group_size"] = site.group_size ? Json::Value(*site.group_size) : Json::Value(Json::nullValue);
    row["area_class"] =
        site.area_class ? Json::Value(area_class_name(*site.area_class)) : Json::Value(Json::nullValue);
    return row;
  }

  Json::Value to_json(const AnalysisResponse &response) {
    Json::Value root;
    root["summary"] = to_json(response.summary);

    Json::Value preview_array(Json::arrayValue);
    for (const Site &site : response.preview) {
      preview_array.append(to_json(site));
    }
    root["preview"] = preview_array;
    root["total_rows"] = response.total_rows;

    Json::Value messages(Json::arrayValue);
    for (const std::string &message : response.messages) {
      messages.append(message);
    }
    root["messages"] = messages;
    root["download_url"] = response.download_url ? Json::Value(*response.download_url) : Json::Value(Json::nullValue);
    return root;
  }

  std::string render_json(const AnalysisResponse &response) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, to_json(response));
  }

}  // namespace sitedensity
