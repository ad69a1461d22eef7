#pragma once

#include <chrono>

namespace sandpool::sandbox {

// Online mean of successful coverage run durations. The coverage timeout
// budget is derived from it.
class RuntimeTracker {
public:
    static constexpr double kNoHistory = -1.0;
    static constexpr double kDefaultBudgetS = 30.0;
    static constexpr double kBudgetSlackS = 2.0;

    void Record(double seconds);

    double Average() const { return average_; }
    int Count() const { return count_; }
    bool HasHistory() const { return count_ > 0; }

    // kDefaultBudgetS before the first sample, Average() + kBudgetSlackS after.
    double BudgetSeconds() const;
    std::chrono::milliseconds Budget() const;

private:
    int count_ = 0;
    double average_ = kNoHistory;
};

}  // namespace sandpool::sandbox
