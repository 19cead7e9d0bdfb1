#include "progress_emitter.hpp"
#include "credential_masker.hpp"
#include "logger.hpp"
#include <algorithm>

namespace xfer {

std::string directionPrefix(TransferDirection direction) {
    return direction == TransferDirection::EXPORT ? "export" : "import";
}

bool TransferEvent::isProgress() const {
    auto colon = name.find(':');
    return colon != std::string::npos && name.compare(colon + 1, std::string::npos, "progress") == 0;
}

bool TransferEvent::isTerminal() const {
    auto colon = name.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    auto suffix = name.substr(colon + 1);
    return suffix == "complete" || suffix == "cancelled";
}

ProgressEmitter::ProgressEmitter(size_t maxQueueSize)
    : maxQueueSize_(maxQueueSize == 0 ? 1 : maxQueueSize) {
    worker_ = std::thread(&ProgressEmitter::workerLoop, this);
}

ProgressEmitter::~ProgressEmitter() {
    stop();
}

void ProgressEmitter::addObserver(std::shared_ptr<ProgressObserver> observer) {
    if (!observer) {
        return;
    }
    std::scoped_lock lock(observersMutex_);
    observers_.push_back(std::move(observer));
}

void ProgressEmitter::removeObserver(const std::shared_ptr<ProgressObserver>& observer) {
    std::scoped_lock lock(observersMutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer),
                     observers_.end());
}

void ProgressEmitter::emitProgress(TransferDirection direction, ProgressEvent event) {
    clampProgress(event);
    enqueue({directionPrefix(direction) + ":progress", nlohmann::json(event)});
}

void ProgressEmitter::emitComplete(TransferDirection direction, nlohmann::json payload) {
    enqueue({directionPrefix(direction) + ":complete", std::move(payload)});
}

void ProgressEmitter::emitCancelled(TransferDirection direction, const std::string& jobId) {
    nlohmann::json payload = nlohmann::json::object();
    if (!jobId.empty()) {
        payload["jobId"] = jobId;
    }
    enqueue({directionPrefix(direction) + ":cancelled", std::move(payload)});
}

void ProgressEmitter::emitWarning(TransferDirection direction, const TransferWarning& warning) {
    nlohmann::json payload = {{"jobId", warning.jobId},
                              {"database", warning.database},
                              {"collection", warning.collection},
                              {"message", maskCredentials(warning.message)}};
    if (warning.skippedCount) {
        payload["skippedCount"] = *warning.skippedCount;
    }
    enqueue({directionPrefix(direction) + ":warning", std::move(payload)});
}

void ProgressEmitter::emitPaused(TransferDirection direction) {
    enqueue({directionPrefix(direction) + ":paused", nlohmann::json::object()});
}

void ProgressEmitter::emitResumed(TransferDirection direction) {
    enqueue({directionPrefix(direction) + ":resumed", nlohmann::json::object()});
}

void ProgressEmitter::forgetJob(const std::string& jobId) {
    std::scoped_lock lock(progressMutex_);
    for (auto it = lastCurrent_.begin(); it != lastCurrent_.end();) {
        if (std::get<0>(it->first) == jobId) {
            it = lastCurrent_.erase(it);
        } else {
            ++it;
        }
    }
    lastProcessed_.erase(jobId);
}

void ProgressEmitter::clampProgress(ProgressEvent& event) {
    std::scoped_lock lock(progressMutex_);
    StreamKey key{event.jobId, event.batchIndex, event.database, event.collection};
    auto& lastCurrent = lastCurrent_.try_emplace(key, event.current).first->second;
    event.current = std::max(event.current, lastCurrent);
    lastCurrent = event.current;

    auto& lastProcessed = lastProcessed_.try_emplace(event.jobId, event.processedRecords).first->second;
    event.processedRecords = std::max(event.processedRecords, lastProcessed);
    lastProcessed = event.processedRecords;

    if (event.total >= 0 && event.current > event.total) {
        event.total = event.current;
    }
    if (event.totalRecords > 0 && event.processedRecords > event.totalRecords) {
        event.totalRecords = event.processedRecords;
    }
}

void ProgressEmitter::enqueue(TransferEvent event) {
    emitted_++;
    {
        std::scoped_lock lock(queueMutex_);
        if (stopping_) {
            dropped_++;
            return;
        }
        if (queue_.size() >= maxQueueSize_ && event.isProgress()) {
            dropped_++;
            return;
        }
        queue_.push_back(std::move(event));
    }
    queueCondition_.notify_one();
}

void ProgressEmitter::workerLoop() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    while (true) {
        queueCondition_.wait(lock, [this] { return !queue_.empty() || stopping_; });
        if (queue_.empty() && stopping_) {
            break;
        }

        TransferEvent event = std::move(queue_.front());
        queue_.pop_front();
        delivering_ = true;
        lock.unlock();

        deliver(event);

        lock.lock();
        delivering_ = false;
        if (queue_.empty()) {
            drainedCondition_.notify_all();
        }
    }
    drainedCondition_.notify_all();
}

void ProgressEmitter::deliver(const TransferEvent& event) {
    std::vector<std::shared_ptr<ProgressObserver>> observers;
    {
        std::scoped_lock lock(observersMutex_);
        observers = observers_;
    }

    for (const auto& observer : observers) {
        try {
            observer->onTransferEvent(event);
        } catch (const std::exception& e) {
            observerFailures_++;
            EmitterLogger::warn("Observer failed to handle {}: {}", event.name, e.what());
        }
    }
    delivered_++;
}

void ProgressEmitter::flush() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    drainedCondition_.wait(lock, [this] {
        return (queue_.empty() && !delivering_) || !worker_.joinable();
    });
}

void ProgressEmitter::stop() {
    {
        std::scoped_lock lock(queueMutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    queueCondition_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

ProgressEmitterStats ProgressEmitter::getStats() const {
    ProgressEmitterStats stats;
    stats.emitted = emitted_.load();
    stats.delivered = delivered_.load();
    stats.dropped = dropped_.load();
    stats.observerFailures = observerFailures_.load();
    return stats;
}

} // namespace xfer
