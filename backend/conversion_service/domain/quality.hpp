#pragma once
#include <string>
#include <string_view>

namespace conversion_service {

struct QualitySetting {
  std::string name;
  std::string preset;   // x265 preset speed, e.g. "slow"
  int crf{22};          // constant rate factor

  bool operator==(const QualitySetting&) const = default;
};

inline constexpr std::string_view kDefaultQuality = "default";

} // namespace conversion_service
