#include "scoring/NumericPolicy.hpp"
#include "errors/Errors.hpp"

namespace ReplayGuard {

FloatingPointGuard::FloatingPointGuard(const NumericPolicy& policy)
    : trapped_(policy.trappedExceptions()) {
    if (trapped_ != 0) {
        std::feclearexcept(trapped_);
    }
}

void FloatingPointGuard::check(const std::string& context) const {
    if (trapped_ == 0) {
        return;
    }

    const int raised = std::fetestexcept(trapped_);
    if (raised == 0) {
        return;
    }

    std::string kind;
    if (raised & FE_OVERFLOW) kind += " overflow";
    if (raised & FE_INVALID) kind += " invalid";
    if (raised & FE_DIVBYZERO) kind += " divide-by-zero";
    throw NumericFault(context + ": floating-point" + kind);
}

} // namespace ReplayGuard
