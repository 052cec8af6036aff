#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "application/conversion_store.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <limits>
#include <thread>

using namespace conversion_service;
using Catch::Matchers::WithinAbs;

namespace {

ConversionStatus pendingStatus(const std::string& output = "converted/clip_abcd1234.mp4") {
  ConversionStatus status;
  status.input_path = "uploads/in.mov";
  status.output_path = output;
  status.format = "mp4";
  status.quality = "default";
  return status;
}

std::vector<StoreEvent> drain(EventChannel& channel) {
  std::vector<StoreEvent> events;
  while (auto event = channel.tryPop()) {
    events.push_back(std::move(*event));
  }
  return events;
}

} // namespace

TEST_CASE("status view derives file name and download url", "[store]")
{
  auto status = pendingStatus("converted/clip_abcd1234.mp4");
  auto pending = makeStatusView("id-1", status);
  REQUIRE(pending.file_name == "clip_abcd1234.mp4");
  REQUIRE_FALSE(pending.download_url.has_value());

  status.complete = true;
  status.progress = 100.0;
  status.outcome = ConversionOutcome::Succeeded;
  auto done = makeStatusView("id-1", status);
  REQUIRE(done.download_url == std::optional<std::string>("/download/clip_abcd1234.mp4"));

  status.error = "boom";
  status.outcome = ConversionOutcome::Failed;
  REQUIRE_FALSE(makeStatusView("id-1", status).download_url.has_value());
}

TEST_CASE("set and get return copies", "[store]")
{
  ConversionStore store;
  store.setStatus("a", pendingStatus());

  auto copy = store.getStatus("a");
  REQUIRE(copy.has_value());
  copy->progress = 50.0;
  REQUIRE(store.getStatus("a")->progress == 0.0);
  REQUIRE_FALSE(store.getStatus("missing").has_value());
}

TEST_CASE("progress is clamped below completion", "[store]")
{
  ConversionStore store;
  store.setStatus("a", pendingStatus());

  REQUIRE(store.setProgressPercentage("a", 150.0));
  REQUIRE_THAT(store.getStatus("a")->progress, WithinAbs(99.0, 1e-9));

  REQUIRE(store.setProgressPercentage("a", -5.0));
  REQUIRE_THAT(store.getStatus("a")->progress, WithinAbs(0.0, 1e-9));

  REQUIRE(store.setProgressPercentage("a", std::numeric_limits<double>::quiet_NaN()));
  REQUIRE_THAT(store.getStatus("a")->progress, WithinAbs(0.0, 1e-9));

  REQUIRE(store.setProgressPercentage("a", 42.5));
  REQUIRE_THAT(store.getStatus("a")->progress, WithinAbs(42.5, 1e-9));

  REQUIRE_FALSE(store.setProgressPercentage("missing", 10.0));
}

TEST_CASE("success completes at one hundred percent", "[store]")
{
  ConversionStore store;
  store.setStatus("a", pendingStatus());
  store.setProgressPercentage("a", 30.0);

  REQUIRE(store.updateStatusOnSuccess("a"));
  auto status = *store.getStatus("a");
  REQUIRE(status.complete);
  REQUIRE(status.error.empty());
  REQUIRE(status.outcome == ConversionOutcome::Succeeded);
  REQUIRE_THAT(status.progress, WithinAbs(100.0, 1e-9));
}

TEST_CASE("error completes with zero progress", "[store]")
{
  ConversionStore store;
  store.setStatus("a", pendingStatus());
  store.setProgressPercentage("a", 30.0);

  REQUIRE(store.updateStatusWithError("a", "encoder crashed"));
  auto status = *store.getStatus("a");
  REQUIRE(status.complete);
  REQUIRE(status.error == "encoder crashed");
  REQUIRE(status.outcome == ConversionOutcome::Failed);
  REQUIRE(status.progress == 0.0);
}

TEST_CASE("first finalizer wins", "[store]")
{
  ConversionStore store;

  SECTION("abort before success")
  {
    store.setStatus("a", pendingStatus());
    REQUIRE(store.updateStatusWithError("a", std::string(kAbortedMessage), ConversionOutcome::Aborted));
    REQUIRE_FALSE(store.updateStatusOnSuccess("a"));
    REQUIRE_FALSE(store.updateStatusWithError("a", "late failure"));

    auto status = *store.getStatus("a");
    REQUIRE(status.outcome == ConversionOutcome::Aborted);
    REQUIRE(status.error == kAbortedMessage);
  }

  SECTION("success before error")
  {
    store.setStatus("a", pendingStatus());
    REQUIRE(store.updateStatusOnSuccess("a"));
    REQUIRE_FALSE(store.updateStatusWithError("a", "late failure"));
    REQUIRE_FALSE(store.setProgressPercentage("a", 10.0));

    auto status = *store.getStatus("a");
    REQUIRE(status.outcome == ConversionOutcome::Succeeded);
    REQUIRE_THAT(status.progress, WithinAbs(100.0, 1e-9));
  }
}

TEST_CASE("concurrent finalizers agree on one outcome", "[store]")
{
  ConversionStore store(1024);
  auto handle = std::make_shared<test::FakeProcessHandle>();

  for (int round = 0; round < 200; ++round) {
    auto id = "race-" + std::to_string(round);
    store.setStatus(id, pendingStatus());
    store.registerActiveCmd(id, handle);
    auto channel = store.subscribe();

    std::atomic<bool> go{false};
    bool success_won = false;
    bool error_won = false;
    bool abort_won = false;
    std::vector<ActiveConversionInfo> seen_active;
    {
      std::jthread success([&] {
        while (!go) {}
        success_won = store.updateStatusOnSuccess(id);
      });
      std::jthread failure([&] {
        while (!go) {}
        error_won = store.updateStatusWithError(id, "encoder crashed");
      });
      std::jthread abort([&] {
        while (!go) {}
        abort_won = store.updateStatusWithError(id, std::string(kAbortedMessage),
                                                ConversionOutcome::Aborted);
      });
      std::jthread reader([&] {
        while (!go) {}
        for (int i = 0; i < 20; ++i) {
          for (auto& info : store.getActiveConversionsInfo()) {
            seen_active.push_back(std::move(info));
          }
        }
      });
      go = true;
    }

    REQUIRE(int(success_won) + int(error_won) + int(abort_won) == 1);

    auto status = *store.getStatus(id);
    REQUIRE(status.complete);
    if (success_won) {
      REQUIRE(status.outcome == ConversionOutcome::Succeeded);
      REQUIRE(status.error.empty());
      REQUIRE(status.progress == 100.0);
    } else if (error_won) {
      REQUIRE(status.outcome == ConversionOutcome::Failed);
      REQUIRE(status.error == "encoder crashed");
    } else {
      REQUIRE(status.outcome == ConversionOutcome::Aborted);
      REQUIRE(status.error == kAbortedMessage);
    }

    // a snapshot taken mid-race only ever shows the job as still running
    for (const auto& info : seen_active) {
      REQUIRE(info.id == id);
      REQUIRE(info.progress < 100.0);
    }

    // exactly one completion event reached the subscriber
    auto events = drain(*channel);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].status->outcome == status.outcome);

    store.unsubscribe(channel);
    store.unregisterActiveCmd(id);
  }
  REQUIRE(store.getActiveConversionsInfo().empty());
}

TEST_CASE("rejected mutations publish nothing", "[store]")
{
  ConversionStore store;
  store.setStatus("a", pendingStatus());
  store.updateStatusOnSuccess("a");

  auto channel = store.subscribe();
  store.updateStatusOnSuccess("a");
  store.updateStatusWithError("a", "late");
  store.setProgressPercentage("a", 5.0);
  store.deleteStatus("missing");

  REQUIRE(channel->size() == 0);
  store.unsubscribe(channel);
}

TEST_CASE("mutations publish the latest status", "[store]")
{
  ConversionStore store;
  auto channel = store.subscribe();

  store.setStatus("a", pendingStatus());
  store.setProgressPercentage("a", 12.0);
  store.updateStatusOnSuccess("a");
  REQUIRE(store.deleteStatus("a"));

  auto events = drain(*channel);
  REQUIRE(events.size() == 4);
  REQUIRE(events[0].type == StoreEventType::Status);
  REQUIRE(events[0].status->progress == 0.0);
  REQUIRE_THAT(events[1].status->progress, WithinAbs(12.0, 1e-9));
  REQUIRE(events[2].status->complete);
  REQUIRE(events[2].status->download_url.has_value());
  REQUIRE(events[3].type == StoreEventType::Removed);
  REQUIRE(events[3].conversion_id == "a");
  REQUIRE_FALSE(events[3].status.has_value());

  store.unsubscribe(channel);
}

TEST_CASE("a full subscriber misses events without blocking others", "[store]")
{
  ConversionStore store(2);
  auto slow = store.subscribe();
  auto fast = store.subscribe();

  store.setStatus("a", pendingStatus());
  for (int i = 1; i <= 5; ++i) {
    store.setProgressPercentage("a", i * 10.0);
    drain(*fast);
  }

  REQUIRE(slow->size() == 2);
  REQUIRE(fast->size() == 0);

  store.unsubscribe(slow);
  store.unsubscribe(fast);
}

TEST_CASE("unsubscribe closes the channel and ignores unknown channels", "[store]")
{
  ConversionStore store;
  auto channel = store.subscribe();
  REQUIRE(store.subscriberCount() == 1);

  store.unsubscribe(channel);
  REQUIRE(channel->isClosed());
  REQUIRE(store.subscriberCount() == 0);

  store.setStatus("a", pendingStatus());
  REQUIRE(channel->size() == 0);

  auto stranger = std::make_shared<EventChannel>(4);
  store.unsubscribe(stranger);
  store.unsubscribe(channel);
  store.unsubscribe(nullptr);
  REQUIRE_FALSE(stranger->isClosed());
}

TEST_CASE("dropped subscribers are pruned on publish", "[store]")
{
  ConversionStore store;
  {
    auto channel = store.subscribe();
    REQUIRE(store.subscriberCount() == 1);
  }
  store.setStatus("a", pendingStatus());
  REQUIRE(store.subscriberCount() == 0);
}

TEST_CASE("active info lists registered jobs that are not complete", "[store]")
{
  ConversionStore store;
  store.setStatus("running", pendingStatus("converted/running_1.mp4"));
  store.setStatus("done", pendingStatus("converted/done_1.mp4"));
  store.setStatus("queued", pendingStatus("converted/queued_1.mp4"));
  store.setProgressPercentage("running", 33.0);

  auto handle = std::make_shared<test::FakeProcessHandle>();
  store.registerActiveCmd("running", handle);
  store.registerActiveCmd("done", handle);
  store.updateStatusOnSuccess("done");

  auto active = store.getActiveConversionsInfo();
  REQUIRE(active.size() == 1);
  REQUIRE(active[0].id == "running");
  REQUIRE(active[0].file_name == "running_1.mp4");
  REQUIRE(active[0].format == "mp4");
  REQUIRE_THAT(active[0].progress, WithinAbs(33.0, 1e-9));

  REQUIRE(store.getActiveCmd("running") == handle);
  store.unregisterActiveCmd("running");
  store.unregisterActiveCmd("running");
  REQUIRE(store.getActiveCmd("running") == nullptr);
  REQUIRE(store.getActiveConversionsInfo().empty());
}

TEST_CASE("job lifecycle as seen by a subscriber", "[store]")
{
  ConversionStore store;
  auto channel = store.subscribe();
  auto handle = std::make_shared<test::FakeProcessHandle>();

  store.setStatus("j1", pendingStatus("converted/movie_j1.mov"));
  store.registerActiveCmd("j1", handle);
  for (int i = 0; i < 4; ++i) {
    auto current = store.getStatus("j1");
    store.setProgressPercentage("j1", current->progress + 0.5);
  }
  store.unregisterActiveCmd("j1");
  store.updateStatusOnSuccess("j1");

  auto events = drain(*channel);
  REQUIRE(events.size() == 6);
  REQUIRE_THAT(events[4].status->progress, WithinAbs(2.0, 1e-9));
  REQUIRE(events.back().status->outcome == ConversionOutcome::Succeeded);
  REQUIRE(events.back().status->download_url == std::optional<std::string>("/download/movie_j1.mov"));

  store.unsubscribe(channel);
}

TEST_CASE("submitted job reaches success through the store", "[store]")
{
  ConversionStore store;
  ConversionStatus status;
  status.output_path = "converted/J1.mp4";
  status.format = "mp4";
  status.quality = "fast";
  store.setStatus("J1", status);

  auto pending = *store.getStatus("J1");
  REQUIRE(pending.progress == 0.0);
  REQUIRE_FALSE(pending.complete);

  store.setProgressPercentage("J1", 150.0);
  REQUIRE_THAT(store.getStatus("J1")->progress, WithinAbs(99.0, 1e-9));

  store.updateStatusOnSuccess("J1");
  auto done = *store.getStatus("J1");
  REQUIRE_THAT(done.progress, WithinAbs(100.0, 1e-9));
  REQUIRE(done.complete);
  REQUIRE(done.error.empty());
}
