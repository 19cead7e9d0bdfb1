#pragma once

#include "transfer_models.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

namespace xfer {

enum class TransferDirection { EXPORT, IMPORT };

std::string directionPrefix(TransferDirection direction);

// One notification, e.g. {"export:progress", {...}}
struct TransferEvent {
  std::string name;
  nlohmann::json payload;

  bool isProgress() const;
  bool isTerminal() const;
};

// External observer of the event stream (GUI, CLI printer, tests)
class ProgressObserver {
public:
  virtual ~ProgressObserver() = default;
  virtual void onTransferEvent(const TransferEvent &event) = 0;
};

// Non-fatal problem inside a job
struct TransferWarning {
  std::string jobId;
  std::string database;
  std::string collection;
  std::string message;
  std::optional<int64_t> skippedCount;
};

struct ProgressEmitterStats {
  uint64_t emitted = 0;
  uint64_t delivered = 0;
  uint64_t dropped = 0;
  uint64_t observerFailures = 0;
};

/**
 * Fire-and-forget event surface. Producers enqueue and return; a worker
 * thread delivers to observers. When the queue is full, progress events are
 * dropped. Terminal events are always queued. Failed deliveries are logged
 * and never retried.
 *
 * Progress for one (jobId, batchIndex, database, collection) stream never
 * goes backwards: current is clamped to the last reported value, and a
 * non-negative total is raised to current when an estimate turns out low.
 * processedRecords is clamped per jobId.
 */
class ProgressEmitter {
public:
  explicit ProgressEmitter(size_t maxQueueSize = 1000);
  ~ProgressEmitter();

  ProgressEmitter(const ProgressEmitter &) = delete;
  ProgressEmitter &operator=(const ProgressEmitter &) = delete;

  void addObserver(std::shared_ptr<ProgressObserver> observer);
  void removeObserver(const std::shared_ptr<ProgressObserver> &observer);

  void emitProgress(TransferDirection direction, ProgressEvent event);
  void emitComplete(TransferDirection direction, nlohmann::json payload);
  void emitCancelled(TransferDirection direction, const std::string &jobId);
  // The message is masked before it leaves the process
  void emitWarning(TransferDirection direction, const TransferWarning &warning);
  void emitPaused(TransferDirection direction);
  void emitResumed(TransferDirection direction);

  // Drops monotonicity state for a finished job
  void forgetJob(const std::string &jobId);

  // Blocks until everything queued so far was delivered
  void flush();
  void stop();

  ProgressEmitterStats getStats() const;

private:
  size_t maxQueueSize_;

  mutable std::mutex queueMutex_;
  std::condition_variable queueCondition_;
  std::condition_variable drainedCondition_;
  std::deque<TransferEvent> queue_;
  bool delivering_ = false;
  bool stopping_ = false;
  std::thread worker_;

  mutable std::mutex observersMutex_;
  std::vector<std::shared_ptr<ProgressObserver>> observers_;

  std::mutex progressMutex_;
  using StreamKey = std::tuple<std::string, int, std::string, std::string>;
  std::map<StreamKey, int64_t> lastCurrent_;
  std::map<std::string, int64_t> lastProcessed_;

  std::atomic<uint64_t> emitted_{0};
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> observerFailures_{0};

  void enqueue(TransferEvent event);
  void workerLoop();
  void deliver(const TransferEvent &event);
  void clampProgress(ProgressEvent &event);
};

} // namespace xfer
