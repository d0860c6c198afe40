#include "internal/scheduler/cache_scheduler.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

namespace fs = std::filesystem;

using framecache::scheduler::SchedulerState;
using framecache::testing::FakeExtractor;
using framecache::testing::FakeGeocoder;
using framecache::testing::TempDir;
using framecache::testing::WriteFile;
using namespace std::chrono_literals;

struct Fixture {
  explicit Fixture(const std::string& name, uint32_t busy_timeout_ms = 5000) : dir(name), pictures(dir.Path() / "pictures") {
    fs::create_directories(pictures);
    WriteFile(pictures / "a.jpg");

    auto config = framecache::testing::MakeConfig(pictures, DbPath());
    config.mutable_database()->mutable_sqlite()->set_busy_timeout_ms(busy_timeout_ms);
    cache = framecache::factory::Build(config, {std::make_shared<FakeExtractor>(), std::make_shared<FakeGeocoder>()});
  }

  fs::path DbPath() const {
    return dir.Path() / "index.db3";
  }

  uint64_t Cycles() {
    return cache->Status().cycles;
  }

  TempDir                                       dir;
  fs::path                                      pictures;
  std::shared_ptr<framecache::core::ImageCache> cache;
};

bool WaitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) return true;
    std::this_thread::sleep_for(10ms);
  }
  return condition();
}

void TestLoopRunsCycles() {
  Fixture f("scheduler_loop");
  assert(f.cache->Status().state == SchedulerState::kRunning);
  assert(!f.cache->Status().looping);

  f.cache->Start();
  assert(f.cache->Status().looping);
  assert(WaitFor([&] { return f.Cycles() >= 2; }));
  assert(f.cache->Status().images == 1);
  assert(f.cache->Status().last_cycle);

  f.cache->Stop();
}

void TestUpdateCacheIsRoutedToLoop() {
  Fixture f("scheduler_routed");
  f.cache->Start();

  const auto before = f.Cycles();
  const auto report = f.cache->UpdateCache();
  (void)report;
  assert(f.Cycles() > before);
  assert(f.cache->Query("", "").size() == 1);

  f.cache->Stop();
}

void TestPauseAndResume() {
  Fixture f("scheduler_pause");
  f.cache->Start();
  assert(WaitFor([&] { return f.Cycles() >= 1; }));

  f.cache->PauseLooping(true);
  // commands are handled in order: once this returns the pause is applied
  f.cache->UpdateCache();
  assert(f.cache->Status().state == SchedulerState::kPaused);

  const auto paused_at = f.Cycles();
  std::this_thread::sleep_for(300ms);
  assert(f.Cycles() == paused_at);

  f.cache->PauseLooping(false);
  assert(WaitFor([&] { return f.Cycles() > paused_at; }));
  assert(f.cache->Status().state == SchedulerState::kRunning);

  f.cache->Stop();
}

void TestStartPaused() {
  Fixture f("scheduler_start_paused");
  f.cache->Start(/*paused=*/true);
  std::this_thread::sleep_for(200ms);
  assert(f.Cycles() == 0);
  assert(f.cache->Status().state == SchedulerState::kPaused);

  // explicit update still runs while paused
  const auto report = f.cache->UpdateCache();
  assert(report.modified_files == 1);
  assert(f.Cycles() == 1);

  f.cache->Stop();
}

void TestStopReleasesWriter() {
  Fixture f("scheduler_stop");
  f.cache->Start();
  assert(WaitFor([&] { return f.Cycles() >= 1; }));

  f.cache->Stop();
  assert(f.cache->Status().state == SchedulerState::kStopped);
  assert(!f.cache->Status().looping);

  bool threw = false;
  try {
    f.cache->UpdateCache();
  } catch (const framecache::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.cache->Start();
  } catch (const framecache::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  // reads keep working on their own connection
  assert(f.cache->Query("", "").size() == 1);

  // writer connection is gone: another writer can take the lock at once
  framecache::db::sqlite::SqliteDB other(f.DbPath().string(), 0);
  other.Exec("BEGIN IMMEDIATE;");
  other.Exec("COMMIT;");

  f.cache->Stop();
}

void TestConcurrentStopReturns() {
  Fixture f("scheduler_concurrent_stop");
  f.cache->Start();
  assert(WaitFor([&] { return f.Cycles() >= 1; }));

  std::thread first([&] { f.cache->Stop(); });
  std::thread second([&] { f.cache->Stop(); });
  first.join();
  second.join();

  assert(f.cache->Status().state == SchedulerState::kStopped);
  assert(!f.cache->Status().looping);
}

void TestFailedCycleDoesNotStopLoop() {
  Fixture f("scheduler_failure", /*busy_timeout_ms=*/50);
  f.cache->Start(/*paused=*/true);

  framecache::db::sqlite::SqliteDB blocker(f.DbPath().string(), 50);
  blocker.Exec("BEGIN IMMEDIATE;");

  bool threw = false;
  try {
    f.cache->UpdateCache();
  } catch (const framecache::util::StoreError&) {
    threw = true;
  }
  assert(threw);
  assert(f.Cycles() == 0);

  blocker.Exec("ROLLBACK;");

  const auto report = f.cache->UpdateCache();
  assert(report.modified_files == 1);
  assert(f.cache->Status().looping);

  f.cache->Stop();
}

} // namespace

int main() {
  TestLoopRunsCycles();
  TestUpdateCacheIsRoutedToLoop();
  TestPauseAndResume();
  TestStartPaused();
  TestStopReleasesWriter();
  TestConcurrentStopReturns();
  TestFailedCycleDoesNotStopLoop();

  std::cout << "framecache_integration_cache_scheduler: pass\n";
  return 0;
}
