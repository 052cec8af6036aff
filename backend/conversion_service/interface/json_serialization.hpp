#pragma once
#include "domain/conversion.hpp"
#include "domain/quality.hpp"
#include <nlohmann/json.hpp>

namespace conversion_service {

void to_json(nlohmann::json& j, const ConversionStatusView& view);
void to_json(nlohmann::json& j, const StoreEvent& event);
void to_json(nlohmann::json& j, const ActiveConversionInfo& info);
void to_json(nlohmann::json& j, const QualitySetting& setting);
void to_json(nlohmann::json& j, const ConvertedFile& file);

} // namespace conversion_service
