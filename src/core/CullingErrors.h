#pragma once

// ============================================================================
// CullingErrors.h - Fatal error types raised by the culling/draw core
// ============================================================================
//
// Contract violations (a collaborator broke its side of the interface) derive
// from ContractViolation and are never recovered. Resource failures during a
// frame derive from ResourceError and abandon the frame; the frame
// orchestration layer decides what happens next.
//

#include <SDL3/SDL_log.h>
#include <cstdarg>
#include <cstdio>
#include <stdexcept>
#include <string>

class ContractViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Object references a mesh or material the managers do not know about
class UnresolvedHandleError : public ContractViolation {
public:
    using ContractViolation::ContractViolation;
};

// More objects than the device culler's pre-allocated buffers can hold
class CapacityExceededError : public ContractViolation {
public:
    using ContractViolation::ContractViolation;
};

// A strategy-tagged value was read as the other strategy
class StrategyMismatchError : public ContractViolation {
public:
    using ContractViolation::ContractViolation;
};

class ResourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace CullingErrors {

inline std::string formatMessage(const char* fmt, va_list args) {
    char buffer[512];
    std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    return std::string(buffer);
}

// Log at critical priority, then throw. Never returns.
template<typename Error>
[[noreturn]] void fail(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string message = formatMessage(fmt, args);
    va_end(args);

    SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "%s", message.c_str());
    throw Error(message);
}

} // namespace CullingErrors
