#include "sandbox/runtime_tracker.hpp"

#include <cmath>

namespace sandpool::sandbox {

void RuntimeTracker::Record(double seconds) {
    ++count_;
    if (count_ == 1) {
        average_ = seconds;
        return;
    }
    average_ += (seconds - average_) / count_;
}

double RuntimeTracker::BudgetSeconds() const {
    if (!HasHistory()) {
        return kDefaultBudgetS;
    }
    return average_ + kBudgetSlackS;
}

std::chrono::milliseconds RuntimeTracker::Budget() const {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(BudgetSeconds() * 1000.0)));
}

}  // namespace sandpool::sandbox
