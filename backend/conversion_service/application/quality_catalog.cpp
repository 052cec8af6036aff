#include "quality_catalog.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace conversion_service {

namespace {

const std::array<QualitySetting, 3> kQualitySettings = {{
  {.name = std::string(kDefaultQuality), .preset = "slow", .crf = 22},
  {.name = "high", .preset = "slower", .crf = 20},
  {.name = "fast", .preset = "medium", .crf = 23},
}};

std::string normalize(std::string_view name) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!name.empty() && is_space(name.front())) name.remove_prefix(1);
  while (!name.empty() && is_space(name.back())) name.remove_suffix(1);

  std::string key(name);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return key;
}

const QualitySetting* find(std::string_view name) {
  auto key = normalize(name);
  for (const auto& setting : kQualitySettings) {
    if (setting.name == key) {
      return &setting;
    }
  }
  return nullptr;
}

} // namespace

QualitySetting resolveQualitySetting(std::string_view name) {
  if (const auto* setting = find(name)) {
    return *setting;
  }
  return kQualitySettings.front();
}

bool isValidQualityName(std::string_view name) {
  return find(name) != nullptr;
}

std::vector<QualitySetting> availableQualitySettings() {
  return {kQualitySettings.begin(), kQualitySettings.end()};
}

} // namespace conversion_service
