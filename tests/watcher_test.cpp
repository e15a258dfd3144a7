#include <gtest/gtest.h>

#include "test_util.hpp"
#include "watcher.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace deskbridge;

class WatcherTest : public ::testing::Test {
 protected:
  WatcherOptions Options() {
    WatcherOptions o;
    o.dir = dir_.path().string();
    o.interval_ms = 10;
    o.restart_backoff_ms = 5;
    o.max_backoff_ms = 20;
    return o;
  }

  FileCallback Recorder(bool accept = true) {
    return [this, accept](const std::filesystem::path& p) {
      std::lock_guard<std::mutex> lock(mu_);
      seen_.push_back(p.filename().string());
      return accept;
    };
  }

  std::vector<std::string> Seen() {
    std::lock_guard<std::mutex> lock(mu_);
    return seen_;
  }

  test::TempDir dir_;
  std::mutex mu_;
  std::vector<std::string> seen_;
};

TEST_F(WatcherTest, EmitsStableFileExactlyOnce) {
  Watcher w(Options(), Recorder());
  test::WriteText(dir_ / "a.json", "{}");
  EXPECT_EQ(w.ScanOnce(), 0u);  // first sighting
  EXPECT_EQ(w.ScanOnce(), 1u);  // unchanged: stable
  EXPECT_EQ(w.ScanOnce(), 0u);
  EXPECT_EQ(Seen(), std::vector<std::string>{"a.json"});
  EXPECT_EQ(w.state(), WatcherState::kIdle);
}

TEST_F(WatcherTest, IgnoresHiddenAndForeignFiles) {
  Watcher w(Options(), Recorder());
  test::WriteText(dir_ / ".a.json.tmp-1.tmp", "{}");
  test::WriteText(dir_ / ".b.json", "{}");
  test::WriteText(dir_ / "c.txt", "x");
  w.ScanOnce();
  w.ScanOnce();
  EXPECT_TRUE(Seen().empty());
}

TEST_F(WatcherTest, WaitsForAFileToStopChanging) {
  Watcher w(Options(), Recorder());
  test::WriteText(dir_ / "grow.json", "{");
  w.ScanOnce();
  test::WriteText(dir_ / "grow.json", "{\"k\": 1}");
  EXPECT_EQ(w.ScanOnce(), 0u);
  EXPECT_EQ(w.ScanOnce(), 1u);
}

TEST_F(WatcherTest, RefusedFileIsOfferedAgainAfterItChanges) {
  int calls = 0;
  Watcher w(Options(), [&](const std::filesystem::path&) { return ++calls > 1; });
  test::WriteText(dir_ / "r.json", "{ broken");
  w.ScanOnce();
  EXPECT_EQ(w.ScanOnce(), 1u);
  EXPECT_EQ(w.ScanOnce(), 0u);  // refused and unchanged
  EXPECT_EQ(calls, 1);

  test::WriteText(dir_ / "r.json", "{\"fixed\": true}");
  w.ScanOnce();
  EXPECT_EQ(w.ScanOnce(), 1u);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(w.ScanOnce(), 0u);
}

TEST_F(WatcherTest, RecreatedNameStartsANewLifetime) {
  Watcher w(Options(), Recorder());
  test::WriteText(dir_ / "x.json", "{}");
  w.ScanOnce();
  w.ScanOnce();
  std::filesystem::remove(dir_ / "x.json");
  w.ScanOnce();
  test::WriteText(dir_ / "x.json", "{}");
  w.ScanOnce();
  w.ScanOnce();
  EXPECT_EQ(Seen(), (std::vector<std::string>{"x.json", "x.json"}));
}

TEST_F(WatcherTest, MissingDirectoryScansEmpty) {
  auto o = Options();
  o.dir = (dir_ / "nope").string();
  Watcher w(o, Recorder());
  EXPECT_EQ(w.ScanOnce(), 0u);
}

TEST_F(WatcherTest, ThreadPicksUpPreexistingFiles) {
  test::WriteText(dir_ / "old.json", "{}");
  Watcher w(Options(), Recorder());
  w.Start();
  EXPECT_TRUE(test::WaitFor([&] { return Seen().size() == 1; }, 2000));
  test::WriteText(dir_ / "new.json", "{}");
  EXPECT_TRUE(test::WaitFor([&] { return Seen().size() == 2; }, 2000));
  w.Stop();
  EXPECT_FALSE(w.running());
}

TEST_F(WatcherTest, CrashedCallbackRestartsAndReconciles) {
  std::atomic<int> calls{0};
  std::atomic<int> accepted{0};
  Watcher w(Options(), [&](const std::filesystem::path&) {
    if (calls.fetch_add(1) == 0) throw std::runtime_error("boom");
    accepted.fetch_add(1);
    return true;
  });
  test::WriteText(dir_ / "c.json", "{}");
  w.Start();
  EXPECT_TRUE(test::WaitFor([&] { return accepted.load() == 1; }, 3000));
  EXPECT_GE(w.restarts(), 1);
  EXPECT_EQ(w.failed_state(), WatcherState::kDispatching);
  w.Stop();
  EXPECT_EQ(accepted.load(), 1);
}

TEST(WatcherStateTest, NamesEveryState) {
  EXPECT_STREQ(WatcherStateName(WatcherState::kIdle), "idle");
  EXPECT_STREQ(WatcherStateName(WatcherState::kScanning), "scanning");
  EXPECT_STREQ(WatcherStateName(WatcherState::kDispatching), "dispatching");
}
