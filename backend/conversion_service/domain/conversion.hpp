#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace conversion_service {

enum class ConversionOutcome {
  Pending,    // not complete yet
  Succeeded,
  Failed,
  Aborted
};

inline std::string_view outcomeName(ConversionOutcome outcome) {
  switch (outcome) {
    case ConversionOutcome::Pending: return "pending";
    case ConversionOutcome::Succeeded: return "succeeded";
    case ConversionOutcome::Failed: return "failed";
    case ConversionOutcome::Aborted: return "aborted";
  }
  return "pending";
}

// Once complete is set the record is frozen; the store rejects later mutations.
struct ConversionStatus {
  std::string input_path;
  std::string output_path;
  std::string format;      // target container like "mp4", "mov"
  std::string quality;     // quality preset name
  double progress{0.0};    // 0-100, 100 only after success
  bool complete{false};
  std::string error;       // empty = no error
  ConversionOutcome outcome{ConversionOutcome::Pending};
};

struct ConversionJob {
  std::string conversion_id;
  std::string source_ref;     // optional reference to where the file came from
  std::string file_name;      // original filename
  std::string target_format;
  std::string quality;
  std::string input_path;
  std::string output_path;
  bool reverse_video{false};
  bool remove_sound{false};
};

// serializable projection of a status, pushed to subscribers
struct ConversionStatusView {
  std::string id;
  std::string file_name;      // base name of the output path
  double progress{0.0};
  bool complete{false};
  std::string error;
  std::string format;
  std::string quality;
  ConversionOutcome outcome{ConversionOutcome::Pending};
  std::optional<std::string> download_url;
};

enum class StoreEventType {
  Status,
  Removed
};

struct StoreEvent {
  StoreEventType type{StoreEventType::Status};
  std::string conversion_id;
  std::optional<ConversionStatusView> status;   // absent for Removed
};

struct ActiveConversionInfo {
  std::string id;
  std::string file_name;
  std::string format;
  std::string quality;
  double progress{0.0};
};

// a finished file in the converted directory
struct ConvertedFile {
  std::string name;
  std::uintmax_t size{0};
  std::chrono::system_clock::time_point modified;
  std::string url;
};

inline constexpr std::string_view kAbortedMessage = "Conversion aborted by user";
inline constexpr std::string_view kDownloadPrefix = "/download/";

} // namespace conversion_service
