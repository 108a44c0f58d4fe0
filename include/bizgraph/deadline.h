#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/deadline.h - Absolute deadlines for bounded operations
// ═══════════════════════════════════════════════════════════════════

#include <algorithm>
#include <chrono>

namespace bizgraph {

class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    Deadline() : at_(Clock::time_point::max()) {}
    explicit Deadline(Clock::time_point at) : at_(at) {}

    static Deadline never() { return Deadline(); }

    static Deadline after(std::chrono::milliseconds ms) {
        return Deadline(Clock::now() + ms);
    }

    static Deadline afterMs(long long ms) {
        return after(std::chrono::milliseconds(ms));
    }

    bool isNever() const { return at_ == Clock::time_point::max(); }

    bool expired() const {
        return !isNever() && Clock::now() >= at_;
    }

    // Time left, clamped at zero. never() reports milliseconds::max().
    std::chrono::milliseconds remaining() const {
        if (isNever()) return std::chrono::milliseconds::max();
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at_ - Clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }

    // The earlier of this deadline and now + ms.
    Deadline capped(std::chrono::milliseconds ms) const {
        auto other = Clock::now() + ms;
        return Deadline(std::min(at_, other));
    }

    Clock::time_point at() const { return at_; }

private:
    Clock::time_point at_;
};

} // namespace bizgraph
