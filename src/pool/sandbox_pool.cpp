#include "pool/sandbox_pool.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "utils/logging.hpp"

namespace sandpool::pool {
namespace {

void DiscardSandbox(sandbox::Sandbox& sandbox) {
    if (!sandbox.Terminate()) {
        utils::LogError("pool") << "container " << sandbox.container_id() << " left running";
    }
}

}  // namespace

int CoresPerSandbox(int total_cores, int capacity) {
    if (capacity < 1) {
        throw std::invalid_argument("pool capacity must be positive, got " + std::to_string(capacity));
    }
    return std::max(1, total_cores / capacity);
}

SandboxPool::SandboxPool(const PoolOptions& options, SandboxFactory factory)
    : capacity_(options.capacity),
      cores_per_sandbox_(pool::CoresPerSandbox(options.total_cores, options.capacity)),
      factory_(std::move(factory)) {
    utils::LogInfo("pool") << "initializing " << capacity_ << " sandbox pairs with "
                           << cores_per_sandbox_ << " cores each";
    pairs_.reserve(static_cast<std::size_t>(capacity_));
    try {
        for (int i = 0; i < capacity_; ++i) {
            pairs_.push_back(CreatePair());
            available_.push(pairs_.back().get());
        }
    } catch (const std::exception& ex) {
        utils::LogError("pool") << "provisioning failed after " << pairs_.size()
                                << " pairs, removing them: " << ex.what();
        if (!Shutdown()) {
            utils::LogError("pool") << "some provisioned containers could not be removed";
        }
        throw;
    }
}

std::unique_ptr<SandboxPair> SandboxPool::CreatePair() {
    auto address = factory_(sandbox::Sanitizer::kAddress, cores_per_sandbox_);
    if (!address) {
        throw std::runtime_error("sandbox factory returned no sandbox");
    }
    std::unique_ptr<sandbox::Sandbox> coverage;
    try {
        coverage = factory_(sandbox::Sanitizer::kCoverage, cores_per_sandbox_);
    } catch (const std::exception&) {
        DiscardSandbox(*address);
        throw;
    }
    if (!coverage) {
        DiscardSandbox(*address);
        throw std::runtime_error("sandbox factory returned no sandbox");
    }
    return std::make_unique<SandboxPair>(std::move(address), std::move(coverage));
}

SandboxPair& SandboxPool::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !available_.empty(); });
    auto* pair = available_.front();
    available_.pop();
    return *pair;
}

SandboxPair* SandboxPool::TryAcquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !available_.empty(); })) {
        return nullptr;
    }
    auto* pair = available_.front();
    available_.pop();
    return pair;
}

void SandboxPool::Release(SandboxPair& pair) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        available_.push(&pair);
    }
    cv_.notify_one();
}

std::size_t SandboxPool::Available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_.size();
}

bool SandboxPool::Shutdown() {
    bool ok = true;
    for (const auto& pair : pairs_) {
        ok = pair->address->Terminate() && ok;
        ok = pair->coverage->Terminate() && ok;
    }
    utils::LogInfo("pool") << "shut down " << pairs_.size() << " sandbox pairs";
    return ok;
}

}  // namespace sandpool::pool
