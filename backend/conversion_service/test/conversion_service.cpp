#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "application/conversion_service.hpp"
#include "test_helpers.hpp"

#include <filesystem>

using namespace conversion_service;
using Catch::Matchers::EndsWith;
using Catch::Matchers::StartsWith;

namespace fs = std::filesystem;

namespace {

struct ServiceFixture {
  test::TempDir dir;
  ConversionStore store;
  std::shared_ptr<test::RecordingQueue> queue = std::make_shared<test::RecordingQueue>();
  fs::path source;

  ServiceFixture() {
    source = dir / "My Holiday.MOV";
    test::writeFile(source, "original video");
  }

  ConversionService makeService(std::shared_ptr<JobQueue> job_queue, size_t max_file_size_mb = 2000) {
    return ConversionService(store, job_queue, dir / "uploads", dir / "converted",
                             dir.path(), max_file_size_mb);
  }

  LocalConversionRequest request(const std::string& format = "mp4") const {
    LocalConversionRequest req;
    req.source_path = source.string();
    req.target_format = format;
    return req;
  }
};

size_t countFiles(const fs::path& dir) {
  if (!fs::exists(dir)) {
    return 0;
  }
  return static_cast<size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
}

} // namespace

TEST_CASE("local file is copied, recorded and queued", "[conversion_service]")
{
  ServiceFixture f;
  auto service = f.makeService(f.queue);

  auto req = f.request("mov");
  req.reverse_video = true;
  req.remove_sound = true;
  auto result = service.submitLocalFile(req);
  REQUIRE(result.has_value());
  const auto& id = *result;
  REQUIRE(id.size() == 36);

  auto status = f.store.getStatus(id);
  REQUIRE(status.has_value());
  REQUIRE_FALSE(status->complete);
  REQUIRE(status->progress == 0.0);
  REQUIRE(status->format == "mov");
  REQUIRE(status->quality == "default");
  REQUIRE(status->outcome == ConversionOutcome::Pending);
  REQUIRE(test::readFile(status->input_path) == "original video");
  REQUIRE_THAT(status->input_path, EndsWith(id + "_My_Holiday.MOV"));
  REQUIRE(fs::path(status->output_path).filename() == "My_Holiday_" + id.substr(0, 8) + ".mov");
  REQUIRE(fs::path(status->output_path).parent_path() == f.dir / "converted");

  auto jobs = f.queue->jobs();
  REQUIRE(jobs.size() == 1);
  REQUIRE(jobs[0].conversion_id == id);
  REQUIRE(jobs[0].input_path == status->input_path);
  REQUIRE(jobs[0].output_path == status->output_path);
  REQUIRE(jobs[0].file_name == "My Holiday.MOV");
  REQUIRE(jobs[0].reverse_video);
  REQUIRE(jobs[0].remove_sound);
  REQUIRE(fs::exists(f.source));
}

TEST_CASE("quality names are normalized on submit", "[conversion_service]")
{
  ServiceFixture f;
  auto service = f.makeService(f.queue);

  auto req = f.request();
  req.quality = " HIGH ";
  auto result = service.submitLocalFile(req);
  REQUIRE(result.has_value());
  REQUIRE(f.store.getStatus(*result)->quality == "high");
  REQUIRE(f.queue->jobs()[0].quality == "high");
}

TEST_CASE("invalid submissions are rejected before anything is stored", "[conversion_service]")
{
  ServiceFixture f;
  auto service = f.makeService(f.queue);
  auto channel = f.store.subscribe();

  SECTION("unsupported format")
  {
    auto result = service.submitLocalFile(f.request("mkv"));
    REQUIRE(result.error().code == SubmitErrorCode::InvalidRequest);
    REQUIRE(result.error().message == "Unsupported target format 'mkv'");
  }

  SECTION("unknown quality")
  {
    auto req = f.request();
    req.quality = "ultra";
    auto result = service.submitLocalFile(req);
    REQUIRE(result.error().code == SubmitErrorCode::InvalidRequest);
  }

  SECTION("missing path")
  {
    auto req = f.request();
    req.source_path.clear();
    auto result = service.submitLocalFile(req);
    REQUIRE(result.error().code == SubmitErrorCode::InvalidRequest);
  }

  SECTION("source does not exist")
  {
    auto req = f.request();
    req.source_path = (f.dir / "missing.mp4").string();
    auto result = service.submitLocalFile(req);
    REQUIRE(result.error().code == SubmitErrorCode::SourceNotFound);
    REQUIRE_THAT(result.error().message, StartsWith("Source file does not exist"));
  }

  SECTION("source is a directory")
  {
    auto req = f.request();
    req.source_path = f.dir.path().string();
    auto result = service.submitLocalFile(req);
    REQUIRE(result.error().code == SubmitErrorCode::SourceNotFound);
  }

  REQUIRE(f.queue->jobs().empty());
  REQUIRE(channel->size() == 0);
  REQUIRE(countFiles(f.dir / "uploads") == 0);
  f.store.unsubscribe(channel);
}

TEST_CASE("a full queue rolls the submission back", "[conversion_service]")
{
  ServiceFixture f;
  auto service = f.makeService(std::make_shared<test::RejectingQueue>());
  auto channel = f.store.subscribe();

  auto result = service.submitLocalFile(f.request());
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().code == SubmitErrorCode::QueueFull);
  REQUIRE_THAT(result.error().message, StartsWith("conversion queue is full"));

  REQUIRE(countFiles(f.dir / "uploads") == 0);

  // the pending status was visible briefly and then removed
  auto created = channel->tryPop();
  REQUIRE(created.has_value());
  REQUIRE(created->type == StoreEventType::Status);
  auto removed = channel->tryPop();
  REQUIRE(removed.has_value());
  REQUIRE(removed->type == StoreEventType::Removed);
  REQUIRE(removed->conversion_id == created->conversion_id);
  REQUIRE_FALSE(f.store.getStatus(created->conversion_id).has_value());
  f.store.unsubscribe(channel);
}

TEST_CASE("each submission gets its own id and files", "[conversion_service]")
{
  ServiceFixture f;
  auto service = f.makeService(f.queue);

  auto first = service.submitLocalFile(f.request());
  auto second = service.submitLocalFile(f.request());
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  REQUIRE(*first != *second);
  REQUIRE(countFiles(f.dir / "uploads") == 2);
}

TEST_CASE("relative paths are taken from the source directory", "[conversion_service]")
{
  ServiceFixture f;
  fs::create_directories(f.dir / "incoming");
  test::writeFile(f.dir / "incoming" / "trip.mov", "nested video");
  auto service = f.makeService(f.queue);

  auto req = f.request();
  req.source_path = "incoming/trip.mov";
  auto result = service.submitLocalFile(req);
  REQUIRE(result.has_value());
  REQUIRE(test::readFile(f.store.getStatus(*result)->input_path) == "nested video");
  REQUIRE(f.queue->jobs()[0].file_name == "trip.mov");
}

TEST_CASE("sources outside the source directory are refused", "[conversion_service]")
{
  ServiceFixture f;
  test::TempDir outside;
  test::writeFile(outside / "private.mov", "someone else's video");
  auto service = f.makeService(f.queue);
  auto channel = f.store.subscribe();
  auto req = f.request();

  SECTION("absolute path")
  {
    req.source_path = (outside / "private.mov").string();
  }

  SECTION("dot-dot segments")
  {
    req.source_path = "../" + outside.path().filename().string() + "/private.mov";
  }

  SECTION("system file")
  {
    req.source_path = "/etc/passwd";
  }

  SECTION("symlink leading out")
  {
    fs::create_symlink(outside / "private.mov", f.dir / "link.mov");
    req.source_path = "link.mov";
  }

  auto result = service.submitLocalFile(req);
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().code == SubmitErrorCode::Forbidden);
  REQUIRE(result.error().message == "Source path is outside the local source directory");

  REQUIRE(f.queue->jobs().empty());
  REQUIRE(channel->size() == 0);
  REQUIRE(countFiles(f.dir / "uploads") == 0);
  f.store.unsubscribe(channel);
}

TEST_CASE("sources over the size limit are refused", "[conversion_service]")
{
  ServiceFixture f;
  auto service = f.makeService(f.queue, 1);

  test::writeFile(f.dir / "exact.mov", std::string(1024 * 1024, 'x'));
  auto req = f.request();
  req.source_path = "exact.mov";
  REQUIRE(service.submitLocalFile(req).has_value());

  test::writeFile(f.dir / "over.mov", std::string(1024 * 1024 + 1, 'x'));
  req.source_path = "over.mov";
  auto result = service.submitLocalFile(req);
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().code == SubmitErrorCode::TooLarge);
  REQUIRE(result.error().message == "File exceeds maximum allowed size (1 MB)");
  REQUIRE(f.queue->jobs().size() == 1);
}

TEST_CASE("a missing source directory is a storage failure", "[conversion_service]")
{
  ServiceFixture f;
  ConversionService service(f.store, f.queue, f.dir / "uploads", f.dir / "converted",
                            f.dir / "no-such-root", 2000);

  auto result = service.submitLocalFile(f.request());
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().code == SubmitErrorCode::StorageFailure);
}
