#pragma once

#include <cfenv>
#include <string>

// [SCORING_AGENT] Floating-point fault policy
// Scoring never hands back NaN or Inf: a fault raised while computing is
// turned into a NumericFault according to this policy.

namespace ReplayGuard {

struct NumericPolicy {
    bool failOnOverflow{true};
    bool failOnInvalid{true};
    bool failOnDivideByZero{true};

    // Everything fatal
    static NumericPolicy failFast() { return NumericPolicy{}; }

    [[nodiscard]] int trappedExceptions() const {
        int mask = 0;
        if (failOnOverflow) mask |= FE_OVERFLOW;
        if (failOnInvalid) mask |= FE_INVALID;
        if (failOnDivideByZero) mask |= FE_DIVBYZERO;
        return mask;
    }
};

// Scoped check of the calling thread's floating-point status flags.
// Construction clears the trapped flags; check() throws NumericFault if
// any of them were raised since.
class FloatingPointGuard {
public:
    explicit FloatingPointGuard(const NumericPolicy& policy);

    FloatingPointGuard(const FloatingPointGuard&) = delete;
    FloatingPointGuard& operator=(const FloatingPointGuard&) = delete;

    void check(const std::string& context) const;

private:
    int trapped_;
};

} // namespace ReplayGuard
