#include "json_serialization.hpp"
#include <ctime>

namespace conversion_service {

namespace {

// UTC, second precision, e.g. 2024-05-01T12:30:00Z
std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

} // namespace

void to_json(nlohmann::json& j, const ConversionStatusView& view) {
  j = nlohmann::json{
    {"id", view.id},
    {"fileName", view.file_name},
    {"progress", view.progress},
    {"complete", view.complete},
    {"error", view.error},
    {"format", view.format},
    {"quality", view.quality},
    {"outcome", std::string(outcomeName(view.outcome))}
  };
  if (view.download_url) {
    j["downloadUrl"] = *view.download_url;
  }
}

void to_json(nlohmann::json& j, const StoreEvent& event) {
  j = nlohmann::json{
    {"type", event.type == StoreEventType::Removed ? "removed" : "status"},
    {"conversionId", event.conversion_id}
  };
  if (event.status) {
    j["status"] = *event.status;
  }
}

void to_json(nlohmann::json& j, const ActiveConversionInfo& info) {
  j = nlohmann::json{
    {"id", info.id},
    {"fileName", info.file_name},
    {"format", info.format},
    {"quality", info.quality},
    {"progress", info.progress}
  };
}

void to_json(nlohmann::json& j, const QualitySetting& setting) {
  j = nlohmann::json{
    {"name", setting.name},
    {"preset", setting.preset},
    {"crf", setting.crf}
  };
}

void to_json(nlohmann::json& j, const ConvertedFile& file) {
  j = nlohmann::json{
    {"name", file.name},
    {"size", file.size},
    {"modTime", formatTimestamp(file.modified)},
    {"url", file.url}
  };
}

} // namespace conversion_service
