#pragma once
#include "conversion_store.hpp"
#include <chrono>
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace conversion_service {

// Turns the encoder's "key=value" progress stream into throttled progress
// updates. The total media duration is not known, so each accepted sample
// advances progress by a fixed step; the store caps it below 100.
class ProgressExtractor {
public:
  ProgressExtractor(ConversionStore& store, std::string conversion_id,
                    std::chrono::milliseconds throttle = std::chrono::milliseconds(500),
                    double step = 0.5);

  // Returns false once the "progress=end" line has been seen.
  bool consumeLine(std::string_view line);

  // Reads until the end sentinel or end of stream. Read errors are only logged.
  void run(std::istream& stream);

  size_t acceptedSamples() const { return accepted_samples_; }
  bool finished() const { return finished_; }

private:
  void applySample();

  ConversionStore& store_;
  std::string conversion_id_;
  std::chrono::milliseconds throttle_;
  double step_;
  std::optional<std::chrono::steady_clock::time_point> last_update_;
  size_t accepted_samples_{0};
  bool finished_{false};
};

} // namespace conversion_service
