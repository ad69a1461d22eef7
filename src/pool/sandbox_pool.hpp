#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandpool::pool {

// The unit of checkout: one crash-detection and one coverage sandbox.
struct SandboxPair {
    SandboxPair(std::unique_ptr<sandbox::Sandbox> address_sandbox,
                std::unique_ptr<sandbox::Sandbox> coverage_sandbox)
        : address(std::move(address_sandbox)), coverage(std::move(coverage_sandbox)) {}

    const std::unique_ptr<sandbox::Sandbox> address;
    const std::unique_ptr<sandbox::Sandbox> coverage;
};

struct PoolOptions {
    int capacity = 4;
    int total_cores = 24;
};

// max(1, total_cores / capacity).
int CoresPerSandbox(int total_cores, int capacity);

// Fixed-size pool of sandbox pairs. All pairs are provisioned serially in
// the constructor; Acquire blocks until one is free and Release hands it
// back. The pool keeps ownership of checked-out pairs.
class SandboxPool {
public:
    using SandboxFactory =
        std::function<std::unique_ptr<sandbox::Sandbox>(sandbox::Sanitizer sanitizer, int cpus)>;

    // Throws whatever the factory throws; no partial pool is kept.
    SandboxPool(const PoolOptions& options, SandboxFactory factory);

    SandboxPool(const SandboxPool&) = delete;
    SandboxPool& operator=(const SandboxPool&) = delete;

    SandboxPair& Acquire();
    SandboxPair* TryAcquire(std::chrono::milliseconds timeout);
    // The caller must hand back only a pair it acquired, exactly once.
    void Release(SandboxPair& pair);

    std::size_t Available() const;
    int Capacity() const { return capacity_; }
    int CoresPerSandbox() const { return cores_per_sandbox_; }

    // Terminates every sandbox, checked out or not. Returns false if any
    // container could not be removed.
    bool Shutdown();

private:
    std::unique_ptr<SandboxPair> CreatePair();

    int capacity_;
    int cores_per_sandbox_;
    SandboxFactory factory_;
    std::vector<std::unique_ptr<SandboxPair>> pairs_;
    std::queue<SandboxPair*> available_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace sandpool::pool
