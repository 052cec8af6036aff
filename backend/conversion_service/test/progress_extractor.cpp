#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "application/progress_extractor.hpp"

#include <sstream>

using namespace conversion_service;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

namespace {

void addPending(ConversionStore& store, const std::string& id) {
  ConversionStatus status;
  status.output_path = "converted/out.mp4";
  status.format = "mp4";
  store.setStatus(id, status);
}

} // namespace

TEST_CASE("each progress sample advances by a fixed step", "[progress]")
{
  ConversionStore store;
  addPending(store, "p");
  ProgressExtractor extractor(store, "p", 0ms, 0.5);

  std::istringstream stream(
    "frame=10\n"
    "fps=24.0\n"
    "out_time_us=400000\n"
    "bitrate=1200kbits/s\n"
    "progress=continue\n"
    "frame=20\n"
    "out_time_us=800000\n"
    "progress=end\n"
    "frame=30\n");
  extractor.run(stream);

  REQUIRE(extractor.finished());
  REQUIRE(extractor.acceptedSamples() == 4);
  REQUIRE_THAT(store.getStatus("p")->progress, WithinAbs(2.0, 1e-9));
}

TEST_CASE("samples inside the throttle window are ignored", "[progress]")
{
  ConversionStore store;
  addPending(store, "p");
  ProgressExtractor extractor(store, "p", 1h, 0.5);

  REQUIRE(extractor.consumeLine("out_time_us=1"));
  REQUIRE(extractor.consumeLine("out_time_us=2"));
  REQUIRE(extractor.consumeLine("frame=3"));

  REQUIRE(extractor.acceptedSamples() == 1);
  REQUIRE_THAT(store.getStatus("p")->progress, WithinAbs(0.5, 1e-9));
}

TEST_CASE("malformed and unrelated lines are skipped", "[progress]")
{
  ConversionStore store;
  addPending(store, "p");
  ProgressExtractor extractor(store, "p", 0ms, 0.5);

  REQUIRE(extractor.consumeLine(""));
  REQUIRE(extractor.consumeLine("garbage without separator"));
  REQUIRE(extractor.consumeLine("speed=1.5x"));
  REQUIRE(extractor.consumeLine("  frame = 12 \r"));
  REQUIRE(extractor.acceptedSamples() == 1);
}

TEST_CASE("end sentinel stops consumption", "[progress]")
{
  ConversionStore store;
  addPending(store, "p");
  ProgressExtractor extractor(store, "p", 0ms, 0.5);

  REQUIRE_FALSE(extractor.consumeLine("progress=end"));
  REQUIRE(extractor.finished());
  REQUIRE_FALSE(extractor.consumeLine("frame=1"));
  REQUIRE(extractor.acceptedSamples() == 0);
}

TEST_CASE("progress never reaches completion through samples", "[progress]")
{
  ConversionStore store;
  addPending(store, "p");
  ProgressExtractor extractor(store, "p", 0ms, 10.0);

  for (int i = 0; i < 20; ++i) {
    extractor.consumeLine("frame=" + std::to_string(i));
  }
  auto status = *store.getStatus("p");
  REQUIRE_THAT(status.progress, WithinAbs(99.0, 1e-9));
  REQUIRE_FALSE(status.complete);
}

TEST_CASE("samples for an unknown or finished job change nothing", "[progress]")
{
  ConversionStore store;
  ProgressExtractor missing(store, "nobody", 0ms, 0.5);
  REQUIRE(missing.consumeLine("frame=1"));
  REQUIRE(missing.acceptedSamples() == 0);
  REQUIRE_FALSE(store.getStatus("nobody").has_value());

  addPending(store, "p");
  store.updateStatusWithError("p", "failed early");
  ProgressExtractor finished(store, "p", 0ms, 0.5);
  finished.consumeLine("frame=1");
  REQUIRE(store.getStatus("p")->progress == 0.0);
}
