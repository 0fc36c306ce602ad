#include "sandbox/worker_pool.hpp"

#include <algorithm>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace anabox::sandbox {

OverflowPolicy ParseOverflowPolicy(const std::string& value) {
    const auto lowered = utils::ToLower(utils::Trim(value));
    if (lowered == "fail_fast" || lowered == "fail-fast" || lowered == "failfast") {
        return OverflowPolicy::kFailFast;
    }
    if (lowered != "block" && !lowered.empty()) {
        utils::LogWarn("sandbox", "unknown overflow policy '" + value + "', using block");
    }
    return OverflowPolicy::kBlock;
}

WorkerPool::Lease::Lease(WorkerPool* pool, std::string correlation_id, std::shared_ptr<Slot> slot)
    : pool_(pool), correlation_id_(std::move(correlation_id)), slot_(std::move(slot)) {}

WorkerPool::Lease::~Lease() {
    Release();
}

WorkerPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_),
      correlation_id_(std::move(other.correlation_id_)),
      slot_(std::move(other.slot_)) {
    other.pool_ = nullptr;
}

WorkerPool::Lease& WorkerPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = other.pool_;
        correlation_id_ = std::move(other.correlation_id_);
        slot_ = std::move(other.slot_);
        other.pool_ = nullptr;
    }
    return *this;
}

bool WorkerPool::Lease::CancelRequested() const {
    return slot_ && slot_->cancel_requested.load();
}

void WorkerPool::Lease::SetState(ExecutionState state) {
    if (!pool_) {
        return;
    }
    std::lock_guard<std::mutex> lock(pool_->mutex_);
    slot_->state = state;
}

void WorkerPool::Lease::Release() noexcept {
    if (!pool_) {
        return;
    }
    pool_->Release(correlation_id_);
    pool_ = nullptr;
    slot_.reset();
}

WorkerPool::WorkerPool(std::size_t capacity, OverflowPolicy policy)
    : capacity_(std::max<std::size_t>(capacity, 1)), policy_(policy) {}

WorkerPool::AdmitResult WorkerPool::Admit(const std::string& correlation_id, Lease& lease) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (slots_.count(correlation_id) > 0) {
        return AdmitResult::kDuplicate;
    }
    if (active_ >= capacity_ && policy_ == OverflowPolicy::kFailFast) {
        return AdmitResult::kAtCapacity;
    }

    auto slot = std::make_shared<Slot>();
    slots_.emplace(correlation_id, slot);
    cv_.wait(lock, [this, &slot] {
        return active_ < capacity_ || slot->cancel_requested.load();
    });
    if (slot->cancel_requested.load()) {
        slots_.erase(correlation_id);
        return AdmitResult::kCancelled;
    }

    ++active_;
    slot->admitted = true;
    lease = Lease(this, correlation_id, std::move(slot));
    return AdmitResult::kAdmitted;
}

bool WorkerPool::Cancel(const std::string& correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(correlation_id);
    if (it == slots_.end()) {
        return false;
    }
    const auto state = it->second->state;
    if (state != ExecutionState::kPending && state != ExecutionState::kRunning) {
        return false;
    }
    it->second->cancel_requested.store(true);
    cv_.notify_all();
    return true;
}

std::optional<ExecutionState> WorkerPool::State(const std::string& correlation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(correlation_id);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    return it->second->state;
}

std::size_t WorkerPool::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void WorkerPool::Release(const std::string& correlation_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(correlation_id);
        if (it != slots_.end() && it->second->admitted) {
            slots_.erase(it);
            --active_;
        }
    }
    cv_.notify_all();
}

}  // namespace anabox::sandbox
