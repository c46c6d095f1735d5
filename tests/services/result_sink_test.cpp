#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "core/batch/batch_types.hpp"
#include "services/result_sink/result_sink.hpp"
#include "support/test_helpers.hpp"

using netbatch::core::batch::BatchResult;
using netbatch::core::batch::CommandResult;
using netbatch::core::batch::CommandStatus;
using netbatch::core::batch::CommandTask;
using netbatch::core::common::Error;
using netbatch::core::common::ErrorCode;
using netbatch::services::result_sink::PersistReceipt;
using netbatch::services::result_sink::ResultSink;
using netbatch::services::result_sink::StoredBlob;
using netbatch::testing::MakeDevice;
using netbatch::testing::TempDir;

namespace {

CommandTask Task(const std::string& device, const std::string& command) {
  CommandTask t;
  t.device = MakeDevice(device);
  t.command = command;
  t.attempt = 1;
  return t;
}

BatchResult TwoDeviceResult(const std::string& r1_version_output) {
  BatchResult r;
  r.run_id = "run-1";
  r.commands = {"show version", "show clock"};
  r.devices_requested = {"R1", "R2"};
  r.results.push_back(CommandResult::Success(Task("R1", "show version"), r1_version_output,
                                             std::chrono::milliseconds(12)));
  r.results.push_back(CommandResult::Success(Task("R1", "show clock"), "12:00:00 UTC",
                                             std::chrono::milliseconds(3)));
  r.results.push_back(CommandResult::Failure(Task("R2", "show version"), CommandStatus::Timeout,
                                             ErrorCode::CommandTimeout, "no prompt within 30000ms"));
  r.results.push_back(CommandResult::Failure(Task("R2", "show clock"), CommandStatus::Error,
                                             ErrorCode::Cancelled, "skipped after earlier failure on device"));
  r.devices_succeeded = {"R1"};
  r.devices_failed = {"R2"};
  r.started_at = std::chrono::system_clock::now();
  r.finished_at = r.started_at + std::chrono::milliseconds(20);
  return r;
}

std::size_t CountFiles(const std::filesystem::path& dir) {
  std::size_t n = 0;
  for (const auto& e : std::filesystem::directory_iterator(dir)) {
    if (e.is_regular_file()) ++n;
  }
  return n;
}

}  // namespace

class ResultSinkTest : public ::testing::Test {
protected:
  ResultSinkTest() : sink_(ResultSink::Options{tmp_.Path() / "results"}) {}

  TempDir tmp_;
  ResultSink sink_;
};

TEST_F(ResultSinkTest, PersistsOneBlobPerDeviceCommand) {
  PersistReceipt receipt;
  Error err;
  ASSERT_TRUE(sink_.Persist(TwoDeviceResult("IOS 15.2\nuptime 3 days"), "inventory", receipt, err))
      << err.ToString();

  EXPECT_EQ(receipt.run_id, "run-1");
  EXPECT_EQ(receipt.category, "inventory");
  EXPECT_EQ(receipt.blobs_written, 4u);
  EXPECT_TRUE(std::filesystem::exists(receipt.manifest_path));
  EXPECT_EQ(CountFiles(sink_.DeviceDir("run-1", "inventory", "R1")), 2u);
  EXPECT_EQ(CountFiles(sink_.DeviceDir("run-1", "inventory", "R2")), 2u);

  std::vector<StoredBlob> blobs;
  ASSERT_TRUE(sink_.Read("run-1", "inventory", "R1", blobs, err));
  ASSERT_EQ(blobs.size(), 2u);
  EXPECT_EQ(blobs[0].command, "show version");
  EXPECT_EQ(blobs[0].index, 0);
  EXPECT_EQ(*blobs[0].output, "IOS 15.2\nuptime 3 days");
  EXPECT_EQ(blobs[0].duration_ms, 12);
  EXPECT_EQ(blobs[0].attempts, 1);
  EXPECT_EQ(blobs[0].run_id, "run-1");
  EXPECT_EQ(blobs[0].category, "inventory");
  EXPECT_TRUE(blobs[0].ok());
  EXPECT_EQ(blobs[1].command, "show clock");
  EXPECT_EQ(blobs[1].index, 1);
}

TEST_F(ResultSinkTest, FailedResultsKeepErrorText) {
  PersistReceipt receipt;
  Error err;
  ASSERT_TRUE(sink_.Persist(TwoDeviceResult("v1"), "inventory", receipt, err));

  const auto blob = sink_.ReadOne("run-1", "inventory", "R2", "show version");
  ASSERT_TRUE(blob.has_value());
  EXPECT_EQ(blob->status, "timeout");
  EXPECT_FALSE(blob->ok());
  EXPECT_FALSE(blob->output.has_value());
  EXPECT_EQ(*blob->error, "no prompt within 30000ms");
}

TEST_F(ResultSinkTest, PersistingTwiceOverwritesInPlace) {
  PersistReceipt receipt;
  Error err;
  ASSERT_TRUE(sink_.Persist(TwoDeviceResult("first"), "inventory", receipt, err));
  ASSERT_TRUE(sink_.Persist(TwoDeviceResult("second"), "inventory", receipt, err));

  EXPECT_EQ(CountFiles(sink_.DeviceDir("run-1", "inventory", "R1")), 2u);
  const auto blob = sink_.ReadOne("run-1", "inventory", "R1", "show version");
  ASSERT_TRUE(blob.has_value());
  EXPECT_EQ(*blob->output, "second");
}

TEST_F(ResultSinkTest, ConcurrentPersistOfSameRunLeavesConsistentBlobs) {
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([this, i] {
      PersistReceipt receipt;
      Error err;
      EXPECT_TRUE(sink_.Persist(TwoDeviceResult("out-" + std::to_string(i)), "inventory", receipt, err));
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(CountFiles(sink_.DeviceDir("run-1", "inventory", "R1")), 2u);
  const auto blob = sink_.ReadOne("run-1", "inventory", "R1", "show version");
  ASSERT_TRUE(blob.has_value());
  EXPECT_EQ(blob->output->rfind("out-", 0), 0u);
}

TEST_F(ResultSinkTest, RunIdOverrideAndListings) {
  PersistReceipt receipt;
  Error err;
  ASSERT_TRUE(sink_.Persist(TwoDeviceResult("v"), "inventory", "nightly", receipt, err));
  ASSERT_TRUE(sink_.Persist(TwoDeviceResult("v"), "audit", "nightly", receipt, err));
  ASSERT_TRUE(sink_.Persist(TwoDeviceResult("v"), "audit", receipt, err));

  EXPECT_EQ(sink_.ListRuns(), (std::vector<std::string>{"nightly", "run-1"}));
  EXPECT_EQ(sink_.ListCategories("nightly"), (std::vector<std::string>{"audit", "inventory"}));
  EXPECT_EQ(sink_.ListDevices("nightly", "audit"), (std::vector<std::string>{"R1", "R2"}));
  EXPECT_TRUE(sink_.ListCategories("missing").empty());
}

TEST_F(ResultSinkTest, ManifestDescribesBatch) {
  PersistReceipt receipt;
  Error err;
  ASSERT_TRUE(sink_.Persist(TwoDeviceResult("v"), "inventory", receipt, err));

  const auto manifest = sink_.ReadManifest("run-1", "inventory");
  ASSERT_TRUE(manifest.has_value());
  EXPECT_NE(manifest->find("\"category\":\"inventory\""), std::string::npos);
  EXPECT_NE(manifest->find("\"devices_failed\":[\"R2\"]"), std::string::npos);
  EXPECT_NE(manifest->find("\"result_count\":4"), std::string::npos);
  EXPECT_FALSE(sink_.ReadManifest("run-1", "other").has_value());
}

TEST_F(ResultSinkTest, NamesThatSanitizeAlikeKeepSeparateBlobs) {
  const std::string long_a = std::string(70, 'x') + "-a";
  const std::string long_b = std::string(70, 'x') + "-b";
  const std::vector<std::string> devices = {"edge:1", "edge/1", "edge 1", long_a, long_b};

  BatchResult r;
  r.run_id = "run:1";
  r.commands = {"show clock"};
  for (const auto& d : devices) {
    r.devices_requested.push_back(d);
    r.devices_succeeded.push_back(d);
    r.results.push_back(CommandResult::Success(Task(d, "show clock"), "clock of " + d,
                                               std::chrono::milliseconds(1)));
  }

  PersistReceipt receipt;
  Error err;
  ASSERT_TRUE(sink_.Persist(r, "inventory", receipt, err)) << err.ToString();
  EXPECT_EQ(receipt.blobs_written, devices.size());

  for (const auto& d : devices) {
    std::vector<StoredBlob> blobs;
    ASSERT_TRUE(sink_.Read("run:1", "inventory", d, blobs, err)) << d;
    ASSERT_EQ(blobs.size(), 1u) << d;
    EXPECT_EQ(blobs[0].device, d);
    EXPECT_EQ(*blobs[0].output, "clock of " + d);
  }
  EXPECT_EQ(sink_.ListDevices("run:1", "inventory"),
            (std::vector<std::string>{"edge 1", "edge/1", "edge:1", long_a, long_b}));

  // Runs whose ids sanitize alike stay apart too.
  r.run_id = "run/1";
  ASSERT_TRUE(sink_.Persist(r, "inventory", receipt, err));
  EXPECT_EQ(sink_.ListRuns(), (std::vector<std::string>{"run/1", "run:1"}));
  EXPECT_NE(sink_.CategoryDir("run:1", "inventory"), sink_.CategoryDir("run/1", "inventory"));
}

TEST_F(ResultSinkTest, ReadingUnknownKeysIsNotFound) {
  std::vector<StoredBlob> blobs;
  Error err;
  EXPECT_FALSE(sink_.Read("run-1", "inventory", "R1", blobs, err));
  EXPECT_EQ(err.code, ErrorCode::NotFound);
  EXPECT_TRUE(blobs.empty());
  EXPECT_FALSE(sink_.ReadOne("run-1", "inventory", "R1", "show version").has_value());
}

TEST_F(ResultSinkTest, BlankKeysAreRejected) {
  PersistReceipt receipt;
  Error err;
  EXPECT_FALSE(sink_.Persist(TwoDeviceResult("v"), " ", receipt, err));
  EXPECT_EQ(err.code, ErrorCode::InvalidArgument);
  EXPECT_FALSE(sink_.Persist(TwoDeviceResult("v"), "inventory", "", receipt, err));
  EXPECT_EQ(err.code, ErrorCode::InvalidArgument);
  EXPECT_TRUE(sink_.ListRuns().empty());
}

TEST(ResultSinkNamingTest, BlobFileNamesAreStableAndDistinct) {
  const auto a = ResultSink::BlobFileName("show ip route");
  EXPECT_EQ(a, ResultSink::BlobFileName("show ip route"));
  EXPECT_EQ(a.rfind("show_ip_route-", 0), 0u);
  EXPECT_EQ(a.substr(a.size() - 5), ".json");
  // Same slug, different hash.
  EXPECT_NE(ResultSink::BlobFileName("show ip/route"), ResultSink::BlobFileName("show ip route"));
}

TEST(ResultSinkNamingTest, ParseBlobRequiresCoreFields) {
  EXPECT_FALSE(ResultSink::ParseBlob("{\"device\":\"R1\",\"status\":\"ok\"}").has_value());
  EXPECT_FALSE(ResultSink::ParseBlob("not json").has_value());

  const auto b = ResultSink::ParseBlob(
      "{\"device\":\"R1\",\"command\":\"show clock\",\"status\":\"ok\",\"output\":\"a\\tb\",\"index\":3}");
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->device, "R1");
  EXPECT_EQ(*b->output, "a\tb");
  EXPECT_EQ(b->index, 3);
  EXPECT_FALSE(b->error.has_value());
}
