#pragma once
#include "domain/quality.hpp"
#include <string_view>
#include <vector>

namespace conversion_service {

// Normalizes the name (trim, lowercase) and returns the matching preset.
// Unknown or empty names fall back to the default preset.
QualitySetting resolveQualitySetting(std::string_view name);

bool isValidQualityName(std::string_view name);

// Presets in presentation order: default, high, fast.
std::vector<QualitySetting> availableQualitySettings();

} // namespace conversion_service
