#pragma once

#include <stdexcept>
#include <string>

// [ALL-AGENTS] Error taxonomy. Nothing in the analysis core retries or
// suppresses these; they surface to whoever started the batch.

namespace ReplayGuard {

// Malformed input: empty trace, too few samples for a bracket,
// non-overlapping traces, unreadable batch document
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

class EmptyTraceError : public InputError {
public:
    explicit EmptyTraceError(const std::string& owner)
        : InputError("trace for '" + owner + "' has no events") {}
};

// Pairing mode not one of "single" / "double"
class InvalidModeError : public std::runtime_error {
public:
    explicit InvalidModeError(const std::string& mode)
        : std::runtime_error("`mode` must be one of 'double' or 'single', got '" + mode + "'") {}
};

// Floating-point overflow / invalid operation while scoring
class NumericFault : public std::runtime_error {
public:
    explicit NumericFault(const std::string& what) : std::runtime_error(what) {}
};

} // namespace ReplayGuard
