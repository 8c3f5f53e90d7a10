#include "util/sync.hpp"

#include <sstream>

#include "util/log.hpp"

namespace veil::util::sync {

namespace {

std::atomic<bool> g_has_global_observer{false};
std::mutex g_global_observer_mutex;
std::shared_ptr<LockObserver> g_global_observer;

std::shared_ptr<LockObserver> GlobalObserver() {
  if (!g_has_global_observer.load(std::memory_order_acquire)) {
    return nullptr;
  }
  std::lock_guard<std::mutex> lock(g_global_observer_mutex);
  return g_global_observer;
}

}  // namespace

const char* LockModeName(LockMode mode) {
  switch (mode) {
    case LockMode::kRead:
      return "read";
    case LockMode::kWrite:
      return "write";
  }
  return "unknown";
}

void SetGlobalLockObserver(std::shared_ptr<LockObserver> observer) {
  std::lock_guard<std::mutex> lock(g_global_observer_mutex);
  g_global_observer = std::move(observer);
  g_has_global_observer.store(g_global_observer != nullptr, std::memory_order_release);
}

RwLock::RwLock(std::string name, std::shared_ptr<LockObserver> observer)
    : name_(std::move(name)) {
  SetObserver(std::move(observer));
}

void RwLock::SetObserver(std::shared_ptr<LockObserver> observer) {
  std::lock_guard<std::mutex> lock(observer_mutex_);
  observer_ = std::move(observer);
  has_observer_.store(observer_ != nullptr, std::memory_order_release);
}

std::shared_ptr<LockObserver> RwLock::ActiveObserver() const {
  if (has_observer_.load(std::memory_order_acquire)) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    if (observer_) {
      return observer_;
    }
  }
  return GlobalObserver();
}

ReadGuard RwLock::Read(std::source_location site) const { return ReadGuard(*this, site); }

WriteGuard RwLock::Write(std::source_location site) { return WriteGuard(*this, site); }

ReadGuard::ReadGuard(const RwLock& lock, std::source_location site)
    : lock_(&lock), observer_(lock.ActiveObserver()) {
  event_.lock_name = &lock.name_;
  event_.mode = LockMode::kRead;
  event_.site = site;
  if (observer_) {
    event_.requested = std::chrono::steady_clock::now();
  }
  lock_->mutex_.lock_shared();
  if (observer_) {
    event_.acquired = std::chrono::steady_clock::now();
    observer_->OnAcquired(event_);
  }
}

ReadGuard::ReadGuard(ReadGuard&& other) noexcept
    : lock_(std::exchange(other.lock_, nullptr)),
      observer_(std::move(other.observer_)),
      event_(other.event_) {}

ReadGuard::~ReadGuard() { Unlock(); }

void ReadGuard::Unlock() {
  if (!lock_) {
    return;
  }
  lock_->mutex_.unlock_shared();
  lock_ = nullptr;
  if (observer_) {
    event_.released = std::chrono::steady_clock::now();
    observer_->OnReleased(event_);
    observer_.reset();
  }
}

WriteGuard::WriteGuard(RwLock& lock, std::source_location site)
    : lock_(&lock), observer_(lock.ActiveObserver()) {
  event_.lock_name = &lock.name_;
  event_.mode = LockMode::kWrite;
  event_.site = site;
  if (observer_) {
    event_.requested = std::chrono::steady_clock::now();
  }
  lock_->mutex_.lock();
  if (observer_) {
    event_.acquired = std::chrono::steady_clock::now();
    observer_->OnAcquired(event_);
  }
}

WriteGuard::WriteGuard(WriteGuard&& other) noexcept
    : lock_(std::exchange(other.lock_, nullptr)),
      observer_(std::move(other.observer_)),
      event_(other.event_) {}

WriteGuard::~WriteGuard() { Unlock(); }

void WriteGuard::Unlock() {
  if (!lock_) {
    return;
  }
  lock_->mutex_.unlock();
  lock_ = nullptr;
  if (observer_) {
    event_.released = std::chrono::steady_clock::now();
    observer_->OnReleased(event_);
    observer_.reset();
  }
}

SlowLockLogger::SlowLockLogger(std::chrono::milliseconds threshold, GuardFilter filter)
    : threshold_(threshold), filter_(filter) {}

bool SlowLockLogger::Matches(LockMode mode) const {
  switch (filter_) {
    case GuardFilter::kAll:
      return true;
    case GuardFilter::kReadOnly:
      return mode == LockMode::kRead;
    case GuardFilter::kWriteOnly:
      return mode == LockMode::kWrite;
  }
  return true;
}

void SlowLockLogger::OnAcquired(const LockEvent&) {}

void SlowLockLogger::OnReleased(const LockEvent& event) {
  if (!Matches(event.mode)) {
    return;
  }
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  const auto waited = duration_cast<milliseconds>(event.acquired - event.requested);
  const auto held = duration_cast<milliseconds>(event.released - event.acquired);
  if (held < threshold_ && waited < threshold_) {
    return;
  }
  reports_.fetch_add(1, std::memory_order_relaxed);
  std::ostringstream oss;
  oss << (event.lock_name && !event.lock_name->empty() ? *event.lock_name : "unnamed") << " "
      << LockModeName(event.mode) << " guard held " << held.count() << "ms (waited "
      << waited.count() << "ms) at " << event.site.file_name() << ":" << event.site.line()
      << " in " << event.site.function_name();
  LogWarn("lock", oss.str());
}

}  // namespace veil::util::sync
