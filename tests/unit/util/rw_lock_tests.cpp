#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "util/log.hpp"
#include "util/sync.hpp"

namespace {

using veil::util::sync::GuardFilter;
using veil::util::sync::LockEvent;
using veil::util::sync::LockMode;
using veil::util::sync::LockObserver;
using veil::util::sync::RwLock;
using veil::util::sync::SlowLockLogger;

struct Recorded {
  std::string name;
  LockMode mode;
  bool released;
  unsigned line;
};

class RecordingObserver final : public LockObserver {
 public:
  void OnAcquired(const LockEvent& event) override { Record(event, false); }
  void OnReleased(const LockEvent& event) override { Record(event, true); }

  std::vector<Recorded> Events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

 private:
  void Record(const LockEvent& event, bool released) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(Recorded{event.lock_name ? *event.lock_name : std::string(), event.mode,
                               released, static_cast<unsigned>(event.site.line())});
  }

  mutable std::mutex mutex_;
  std::vector<Recorded> events_;
};

// Reacquires the lock it watches from inside OnReleased(); this only works
// when the guard has already dropped the mutex.
class ReacquiringObserver final : public LockObserver {
 public:
  explicit ReacquiringObserver(RwLock* lock) : lock_(lock) {}
  void OnAcquired(const LockEvent&) override {}
  void OnReleased(const LockEvent& event) override {
    if (event.mode != LockMode::kWrite || inside_) {
      return;
    }
    inside_ = true;
    {
      auto again = lock_->Write();
      reacquired_ = again.OwnsLock();
    }
    inside_ = false;
  }
  bool Reacquired() const { return reacquired_; }

 private:
  RwLock* lock_;
  bool inside_{false};
  bool reacquired_{false};
};

bool TestObserverSeesAcquireAndRelease() {
  auto observer = std::make_shared<RecordingObserver>();
  RwLock lock("chain", observer);
  unsigned write_line = 0;
  {
    write_line = __LINE__ + 1;
    auto guard = lock.Write();
  }
  {
    auto guard = lock.Read();
  }
  const auto events = observer->Events();
  if (events.size() != 4) {
    std::cerr << "rw_lock_tests: expected 4 events, got " << events.size() << "\n";
    return false;
  }
  if (events[0].name != "chain" || events[0].mode != LockMode::kWrite || events[0].released ||
      !events[1].released || events[1].mode != LockMode::kWrite) {
    std::cerr << "rw_lock_tests: write guard events out of order\n";
    return false;
  }
  if (events[0].line != write_line) {
    std::cerr << "rw_lock_tests: acquisition site line not recorded\n";
    return false;
  }
  if (events[2].mode != LockMode::kRead || events[2].released || !events[3].released) {
    std::cerr << "rw_lock_tests: read guard events out of order\n";
    return false;
  }
  return true;
}

bool TestReleaseReportedAfterUnlock() {
  RwLock lock("mempool");
  auto observer = std::make_shared<ReacquiringObserver>(&lock);
  lock.SetObserver(observer);
  {
    auto guard = lock.Write();
  }
  if (!observer->Reacquired()) {
    std::cerr << "rw_lock_tests: lock still held when release was reported\n";
    return false;
  }
  return true;
}

bool TestNoObserverNoEvents() {
  auto observer = std::make_shared<RecordingObserver>();
  RwLock lock("quiet");
  {
    auto guard = lock.Write();
  }
  lock.SetObserver(observer);
  lock.SetObserver(nullptr);
  {
    auto guard = lock.Read();
  }
  if (!observer->Events().empty()) {
    std::cerr << "rw_lock_tests: detached observer still notified\n";
    return false;
  }
  return true;
}

bool TestGlobalObserver() {
  auto global = std::make_shared<RecordingObserver>();
  auto local = std::make_shared<RecordingObserver>();
  RwLock plain("plain");
  RwLock own("own", local);
  veil::util::sync::SetGlobalLockObserver(global);
  {
    auto a = plain.Write();
  }
  {
    auto b = own.Write();
  }
  veil::util::sync::SetGlobalLockObserver(nullptr);
  {
    auto c = plain.Write();
  }
  const auto global_events = global->Events();
  if (global_events.size() != 2 || global_events[0].name != "plain") {
    std::cerr << "rw_lock_tests: global observer saw " << global_events.size() << " events\n";
    return false;
  }
  if (local->Events().size() != 2) {
    std::cerr << "rw_lock_tests: lock observer should take precedence over the global one\n";
    return false;
  }
  return true;
}

bool TestEarlyUnlock() {
  auto observer = std::make_shared<RecordingObserver>();
  RwLock lock("early", observer);
  {
    auto guard = lock.Write();
    guard.Unlock();
    if (guard.OwnsLock()) {
      std::cerr << "rw_lock_tests: guard still owns lock after Unlock\n";
      return false;
    }
    auto second = lock.Write();
    if (!second.OwnsLock()) {
      std::cerr << "rw_lock_tests: lock not available after early unlock\n";
      return false;
    }
  }
  if (observer->Events().size() != 4) {
    std::cerr << "rw_lock_tests: early unlock reported twice\n";
    return false;
  }
  return true;
}

bool TestSharedReaders() {
  RwLock lock("readers");
  auto first = lock.Read();
  auto second = lock.Read();
  if (!first.OwnsLock() || !second.OwnsLock()) {
    std::cerr << "rw_lock_tests: readers should share the lock\n";
    return false;
  }
  return true;
}

bool TestGuardedCounter() {
  veil::util::sync::Guarded<int> counter("counter", 0);
  constexpr int kThreads = 4;
  constexpr int kIncrements = 1000;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&counter] {
      for (int i = 0; i < kIncrements; ++i) {
        counter.WithWrite([](int& value) { ++value; });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  const int total = counter.WithRead([](const int& value) { return value; });
  if (total != kThreads * kIncrements) {
    std::cerr << "rw_lock_tests: guarded counter lost updates (" << total << ")\n";
    return false;
  }
  return true;
}

bool TestSlowLockLogger() {
  using namespace std::chrono_literals;
  auto logger = std::make_shared<SlowLockLogger>(10ms, GuardFilter::kWriteOnly);
  RwLock lock("slow", logger);
  std::atomic<int> warnings{0};
  std::string last_message;
  std::mutex message_mutex;
  veil::util::GetLogger().SetCaptureForTest(
      [&](veil::util::LogLevel level, std::string_view component, const std::string& message) {
        if (component == "lock" && level == veil::util::LogLevel::kWarn) {
          warnings.fetch_add(1);
          std::lock_guard<std::mutex> guard(message_mutex);
          last_message = message;
        }
      });

  {
    auto guard = lock.Write();
  }
  {
    auto guard = lock.Read();
    std::this_thread::sleep_for(30ms);
  }
  if (logger->Reports() != 0) {
    std::cerr << "rw_lock_tests: filtered or fast guards should not be reported\n";
    veil::util::GetLogger().SetCaptureForTest(nullptr);
    return false;
  }
  {
    auto guard = lock.Write();
    std::this_thread::sleep_for(30ms);
  }
  veil::util::GetLogger().SetCaptureForTest(nullptr);
  if (logger->Reports() != 1 || warnings.load() != 1) {
    std::cerr << "rw_lock_tests: slow write guard not reported exactly once\n";
    return false;
  }
  if (last_message.find("slow") == std::string::npos) {
    std::cerr << "rw_lock_tests: report should name the lock: " << last_message << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestObserverSeesAcquireAndRelease();
  ok &= TestReleaseReportedAfterUnlock();
  ok &= TestNoObserverNoEvents();
  ok &= TestGlobalObserver();
  ok &= TestEarlyUnlock();
  ok &= TestSharedReaders();
  ok &= TestGuardedCounter();
  ok &= TestSlowLockLogger();
  if (!ok) {
    return EXIT_FAILURE;
  }
  std::cout << "rw_lock_tests: OK\n";
  return EXIT_SUCCESS;
}
