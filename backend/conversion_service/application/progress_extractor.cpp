#include "progress_extractor.hpp"
#include <iostream>

namespace conversion_service {

namespace {

std::string_view trim(std::string_view s) {
  const char* whitespace = " \t\r\n";
  auto begin = s.find_first_not_of(whitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(begin, end - begin + 1);
}

} // namespace

ProgressExtractor::ProgressExtractor(ConversionStore& store, std::string conversion_id,
                                     std::chrono::milliseconds throttle, double step)
  : store_(store), conversion_id_(std::move(conversion_id)), throttle_(throttle), step_(step) {}

bool ProgressExtractor::consumeLine(std::string_view line) {
  if (finished_) {
    return false;
  }

  auto trimmed = trim(line);
  auto pos = trimmed.find('=');
  if (pos == std::string_view::npos) {
    return true;
  }
  auto key = trim(trimmed.substr(0, pos));
  auto value = trim(trimmed.substr(pos + 1));

  if (key == "progress" && value == "end") {
    std::cout << "Encoder progress stream ended for job " + conversion_id_ + "\n";
    finished_ = true;
    return false;
  }

  if (key == "out_time_us" || key == "frame") {
    auto now = std::chrono::steady_clock::now();
    if (!last_update_ || now - *last_update_ >= throttle_) {
      applySample();
      last_update_ = now;
    }
  }
  // everything else (bitrate, speed, fps, ...) is ignored
  return true;
}

void ProgressExtractor::run(std::istream& stream) {
  std::string line;
  while (std::getline(stream, line)) {
    if (!consumeLine(line)) {
      return;
    }
  }

  if (stream.bad()) {
    std::cerr << "WARN [job " + conversion_id_ + "]: error reading encoder progress stream\n";
  }
}

void ProgressExtractor::applySample() {
  auto status = store_.getStatus(conversion_id_);
  if (!status) {
    std::cerr << "WARN [job " + conversion_id_ + "]: status not found during progress update\n";
    return;
  }
  ++accepted_samples_;
  store_.setProgressPercentage(conversion_id_, status->progress + step_);
}

} // namespace conversion_service
