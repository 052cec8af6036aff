#include "encoder_command.hpp"
#include <algorithm>
#include <thread>

namespace conversion_service {

const std::vector<std::string>& supportedFormats() {
  static const std::vector<std::string> formats = {"mov", "mp4", "avi"};
  return formats;
}

bool isSupportedFormat(std::string_view format) {
  const auto& formats = supportedFormats();
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

int defaultEncoderThreads() {
  int threads = static_cast<int>(std::thread::hardware_concurrency()) - 2;
  return threads < 1 ? 1 : threads;
}

std::expected<std::vector<std::string>, std::string> buildEncoderArgs(
    const ConversionJob& job,
    const QualitySetting& quality,
    int threads) {

  if (threads < 1) {
    threads = defaultEncoderThreads();
  }

  std::vector<std::string> args = {
    "-i", job.input_path,
    "-threads", std::to_string(threads),
    "-progress", "pipe:1",
    "-nostats",
    "-v", "warning"
  };

  if (job.reverse_video) {
    args.insert(args.end(), {"-vf", "reverse"});
  }

  if (job.remove_sound) {
    args.push_back("-an");
  } else if (job.reverse_video) {
    args.insert(args.end(), {"-af", "areverse"});
  } else {
    args.insert(args.end(), {"-c:a", "copy"});
  }

  const auto crf = std::to_string(quality.crf);
  if (job.target_format == "mov") {
    args.insert(args.end(), {"-tag:v", "hvc1", "-c:v", "libx265",
                             "-preset", quality.preset, "-crf", crf});
  } else if (job.target_format == "mp4") {
    args.insert(args.end(), {"-c:v", "libx265", "-preset", quality.preset,
                             "-crf", crf, "-movflags", "+faststart"});
  } else if (job.target_format == "avi") {
    args.insert(args.end(), {"-c:v", "libxvid", "-q:v", "3"});
  } else {
    return std::unexpected("Unsupported target format '" + job.target_format + "'");
  }

  args.push_back(job.output_path);
  return args;
}

} // namespace conversion_service
