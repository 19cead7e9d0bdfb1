#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace xfer {

class PauseGate;

// Cooperative cancellation flag for one in-flight job
class CancellationToken {
public:
  explicit CancellationToken(std::string jobId, PauseGate *gate = nullptr);

  const std::string &jobId() const { return jobId_; }

  // Also wakes anything parked on the owning pause gate
  void cancel();
  bool isCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

private:
  std::string jobId_;
  PauseGate *gate_;
  std::atomic<bool> cancelled_{false};
};

// Shared pause switch polled by record loops. Never preempts anything.
class PauseGate {
public:
  void pause();
  // Releases every waiter
  void resume();
  bool isPaused() const;

  // Blocks while paused. Returns false when the token is (or becomes)
  // cancelled, true when work may continue.
  bool waitIfPaused(const CancellationToken &token);

  // Clears the flag without waking anyone
  void reset();
  // Wakes waiters so they re-check their tokens
  void wake();

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool paused_ = false;
};

/**
 * Per-job token registry sharing one pause gate. One registry per transfer
 * direction, owned by the engine.
 */
class CancellationRegistry {
public:
  CancellationRegistry() = default;
  CancellationRegistry(const CancellationRegistry &) = delete;
  CancellationRegistry &operator=(const CancellationRegistry &) = delete;

  // Throws ValidationException when the id is already registered
  std::shared_ptr<CancellationToken> registerJob(const std::string &jobId);

  // Clears the pause flag once the last job is gone
  void unregisterJob(const std::string &jobId);

  // Cancels one job, or every job when no id is given. Returns the number of
  // tokens that were cancelled.
  size_t cancel(const std::optional<std::string> &jobId = std::nullopt);

  bool isRegistered(const std::string &jobId) const;
  size_t activeCount() const;
  std::vector<std::string> activeJobIds() const;

  PauseGate &gate() { return gate_; }
  const PauseGate &gate() const { return gate_; }

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<CancellationToken>> tokens_;
  PauseGate gate_;
};

// RAII registration for the lifetime of a job
class JobScope {
public:
  JobScope(CancellationRegistry &registry, std::string jobId);
  ~JobScope();

  JobScope(const JobScope &) = delete;
  JobScope &operator=(const JobScope &) = delete;

  const std::string &jobId() const { return jobId_; }
  CancellationToken &token() { return *token_; }
  PauseGate &gate() { return registry_.gate(); }

private:
  CancellationRegistry &registry_;
  std::string jobId_;
  std::shared_ptr<CancellationToken> token_;
};

// Checks gate and token every `interval` records instead of on every record
class RecordPoller {
public:
  RecordPoller(PauseGate &gate, const CancellationToken &token,
               size_t interval);

  // Counts one record. Returns false once cancellation was observed.
  bool tick();
  // Polls immediately regardless of the counter
  bool checkNow();

  size_t count() const { return count_; }

private:
  PauseGate &gate_;
  const CancellationToken &token_;
  size_t interval_;
  size_t count_ = 0;
};

} // namespace xfer
