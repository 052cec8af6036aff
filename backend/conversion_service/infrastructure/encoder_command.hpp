#pragma once
#include "domain/conversion.hpp"
#include "domain/quality.hpp"
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace conversion_service {

// Supported containers in presentation order: mov, mp4, avi.
const std::vector<std::string>& supportedFormats();
bool isSupportedFormat(std::string_view format);

// CPU count minus two, at least one.
int defaultEncoderThreads();

// Encoder command line (without the executable) for one job. Progress goes
// to stdout as key=value lines, diagnostics to stderr.
std::expected<std::vector<std::string>, std::string> buildEncoderArgs(
  const ConversionJob& job,
  const QualitySetting& quality,
  int threads
);

} // namespace conversion_service
