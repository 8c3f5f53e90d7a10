#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <source_location>
#include <string>
#include <utility>

namespace veil::util::sync {

enum class LockMode {
  kRead,
  kWrite,
};

const char* LockModeName(LockMode mode);

struct LockEvent {
  const std::string* lock_name{nullptr};
  LockMode mode{LockMode::kRead};
  std::source_location site{};
  std::chrono::steady_clock::time_point requested{};
  std::chrono::steady_clock::time_point acquired{};
  // Only set for OnReleased().
  std::chrono::steady_clock::time_point released{};
};

// Diagnostics hook attached to the guard lifecycle. OnAcquired() runs while
// the lock is held and must stay cheap; OnReleased() runs after the unlock.
class LockObserver {
 public:
  virtual ~LockObserver() = default;
  virtual void OnAcquired(const LockEvent& event) = 0;
  virtual void OnReleased(const LockEvent& event) = 0;
};

// Observer used by every lock without one of its own. None by default.
void SetGlobalLockObserver(std::shared_ptr<LockObserver> observer);

class ReadGuard;
class WriteGuard;

// Reader/writer lock. Guards capture their acquisition site; when no
// observer is installed no clock is read.
class RwLock {
 public:
  explicit RwLock(std::string name = {}, std::shared_ptr<LockObserver> observer = nullptr);
  RwLock(const RwLock&) = delete;
  RwLock& operator=(const RwLock&) = delete;

  [[nodiscard]] ReadGuard Read(std::source_location site = std::source_location::current()) const;
  [[nodiscard]] WriteGuard Write(std::source_location site = std::source_location::current());

  void SetObserver(std::shared_ptr<LockObserver> observer);
  const std::string& Name() const noexcept { return name_; }

 private:
  friend class ReadGuard;
  friend class WriteGuard;

  std::shared_ptr<LockObserver> ActiveObserver() const;

  mutable std::shared_mutex mutex_;
  std::string name_;
  std::atomic<bool> has_observer_{false};
  mutable std::mutex observer_mutex_;
  std::shared_ptr<LockObserver> observer_;
};

class ReadGuard {
 public:
  ReadGuard(ReadGuard&& other) noexcept;
  ReadGuard& operator=(ReadGuard&&) = delete;
  ReadGuard(const ReadGuard&) = delete;
  ReadGuard& operator=(const ReadGuard&) = delete;
  ~ReadGuard();

  // Releases early; the destructor then does nothing.
  void Unlock();
  bool OwnsLock() const noexcept { return lock_ != nullptr; }

 private:
  friend class RwLock;
  ReadGuard(const RwLock& lock, std::source_location site);

  const RwLock* lock_{nullptr};
  std::shared_ptr<LockObserver> observer_;
  LockEvent event_{};
};

class WriteGuard {
 public:
  WriteGuard(WriteGuard&& other) noexcept;
  WriteGuard& operator=(WriteGuard&&) = delete;
  WriteGuard(const WriteGuard&) = delete;
  WriteGuard& operator=(const WriteGuard&) = delete;
  ~WriteGuard();

  void Unlock();
  bool OwnsLock() const noexcept { return lock_ != nullptr; }

 private:
  friend class RwLock;
  WriteGuard(RwLock& lock, std::source_location site);

  RwLock* lock_{nullptr};
  std::shared_ptr<LockObserver> observer_;
  LockEvent event_{};
};

// A value that can only be reached through its lock.
template <typename T>
class Guarded {
 public:
  template <typename... Args>
  explicit Guarded(std::string name, Args&&... args)
      : lock_(std::move(name)), value_(std::forward<Args>(args)...) {}

  template <typename Fn>
  auto WithRead(Fn&& fn, std::source_location site = std::source_location::current()) const {
    auto guard = lock_.Read(site);
    return fn(static_cast<const T&>(value_));
  }

  template <typename Fn>
  auto WithWrite(Fn&& fn, std::source_location site = std::source_location::current()) {
    auto guard = lock_.Write(site);
    return fn(value_);
  }

  RwLock& Lock() noexcept { return lock_; }

 private:
  mutable RwLock lock_;
  T value_;
};

enum class GuardFilter {
  kAll,
  kReadOnly,
  kWriteOnly,
};

// Logs guards held (or waited for) longer than the threshold, once the
// guard has been released.
class SlowLockLogger final : public LockObserver {
 public:
  explicit SlowLockLogger(std::chrono::milliseconds threshold = std::chrono::milliseconds(100),
                          GuardFilter filter = GuardFilter::kAll);

  void OnAcquired(const LockEvent& event) override;
  void OnReleased(const LockEvent& event) override;

  std::uint64_t Reports() const noexcept { return reports_.load(std::memory_order_relaxed); }

 private:
  bool Matches(LockMode mode) const;

  std::chrono::milliseconds threshold_;
  GuardFilter filter_;
  std::atomic<std::uint64_t> reports_{0};
};

}  // namespace veil::util::sync
