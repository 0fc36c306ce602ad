#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "sandbox/sandbox_types.hpp"

namespace anabox::sandbox {

enum class OverflowPolicy {
    kBlock,
    kFailFast
};

OverflowPolicy ParseOverflowPolicy(const std::string& value);

// Bounds concurrent workers and keeps at most one execution per correlation id.
class WorkerPool {
    struct Slot {
        ExecutionState state = ExecutionState::kPending;
        bool admitted = false;
        std::atomic<bool> cancel_requested{false};
    };

public:
    enum class AdmitResult {
        kAdmitted,
        kDuplicate,
        kAtCapacity,
        kCancelled
    };

    class Lease {
    public:
        Lease() = default;
        ~Lease();
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        explicit operator bool() const { return pool_ != nullptr; }
        bool CancelRequested() const;
        void SetState(ExecutionState state);

    private:
        friend class WorkerPool;
        Lease(WorkerPool* pool, std::string correlation_id, std::shared_ptr<Slot> slot);
        void Release() noexcept;

        WorkerPool* pool_ = nullptr;
        std::string correlation_id_;
        std::shared_ptr<Slot> slot_;
    };

    WorkerPool(std::size_t capacity, OverflowPolicy policy);

    // Blocks under kBlock until a worker is free. On kAdmitted, `lease` holds
    // the slot until it is destroyed.
    AdmitResult Admit(const std::string& correlation_id, Lease& lease);

    // Requests termination of a pending or running execution. False when no
    // execution with that id is live.
    bool Cancel(const std::string& correlation_id);

    std::optional<ExecutionState> State(const std::string& correlation_id) const;
    std::size_t ActiveCount() const;
    std::size_t Capacity() const { return capacity_; }
    OverflowPolicy Policy() const { return policy_; }

private:
    void Release(const std::string& correlation_id);

    const std::size_t capacity_;
    const OverflowPolicy policy_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
    std::size_t active_ = 0;
};

}  // namespace anabox::sandbox
