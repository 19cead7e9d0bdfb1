#include "cancellation.hpp"
#include "logger.hpp"
#include "transfer_exceptions.hpp"

namespace xfer {

CancellationToken::CancellationToken(std::string jobId, PauseGate* gate)
    : jobId_(std::move(jobId)), gate_(gate) {}

void CancellationToken::cancel() {
    cancelled_.store(true, std::memory_order_release);
    if (gate_) {
        gate_->wake();
    }
}

void PauseGate::pause() {
    std::scoped_lock lock(mutex_);
    paused_ = true;
}

void PauseGate::resume() {
    {
        std::scoped_lock lock(mutex_);
        paused_ = false;
    }
    cv_.notify_all();
}

bool PauseGate::isPaused() const {
    std::scoped_lock lock(mutex_);
    return paused_;
}

bool PauseGate::waitIfPaused(const CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this, &token] { return !paused_ || token.isCancelled(); });
    return !token.isCancelled();
}

void PauseGate::reset() {
    std::scoped_lock lock(mutex_);
    paused_ = false;
}

void PauseGate::wake() {
    // Taking the lock orders the wake after any predicate check in progress
    { std::scoped_lock lock(mutex_); }
    cv_.notify_all();
}

std::shared_ptr<CancellationToken> CancellationRegistry::registerJob(const std::string& jobId) {
    std::scoped_lock lock(mutex_);
    if (tokens_.count(jobId) > 0) {
        throw ValidationException(ErrorCode::INVALID_INPUT,
                                  "job already registered: " + jobId, "jobId", jobId);
    }
    auto token = std::make_shared<CancellationToken>(jobId, &gate_);
    tokens_.emplace(jobId, token);
    CancelLogger::debug("Registered job {} ({} active)", jobId, tokens_.size());
    return token;
}

void CancellationRegistry::unregisterJob(const std::string& jobId) {
    std::scoped_lock lock(mutex_);
    tokens_.erase(jobId);
    if (tokens_.empty()) {
        gate_.reset();
    }
}

size_t CancellationRegistry::cancel(const std::optional<std::string>& jobId) {
    size_t cancelled = 0;
    {
        std::scoped_lock lock(mutex_);
        if (!jobId) {
            for (auto& [id, token] : tokens_) {
                token->cancel();
                ++cancelled;
            }
        } else if (auto it = tokens_.find(*jobId); it != tokens_.end()) {
            it->second->cancel();
            ++cancelled;
        }
    }
    gate_.wake();
    CancelLogger::info("Cancellation requested for {} ({} job(s))",
                       jobId.value_or("all jobs"), cancelled);
    return cancelled;
}

bool CancellationRegistry::isRegistered(const std::string& jobId) const {
    std::scoped_lock lock(mutex_);
    return tokens_.count(jobId) > 0;
}

size_t CancellationRegistry::activeCount() const {
    std::scoped_lock lock(mutex_);
    return tokens_.size();
}

std::vector<std::string> CancellationRegistry::activeJobIds() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(tokens_.size());
    for (const auto& [id, token] : tokens_) {
        ids.push_back(id);
    }
    return ids;
}

JobScope::JobScope(CancellationRegistry& registry, std::string jobId)
    : registry_(registry), jobId_(std::move(jobId)),
      token_(registry.registerJob(jobId_)) {}

JobScope::~JobScope() {
    registry_.unregisterJob(jobId_);
}

RecordPoller::RecordPoller(PauseGate& gate, const CancellationToken& token, size_t interval)
    : gate_(gate), token_(token), interval_(interval == 0 ? 1 : interval) {}

bool RecordPoller::tick() {
    ++count_;
    if (count_ % interval_ != 0) {
        return true;
    }
    return checkNow();
}

bool RecordPoller::checkNow() {
    if (token_.isCancelled()) {
        return false;
    }
    return gate_.waitIfPaused(token_);
}

} // namespace xfer
