#pragma once

/// @file fatal.hpp
/// @brief Fatal condition reporting for strata_core
///
/// Programming errors detected by the store (type tag mismatch, index out of
/// bounds, allocation failure) terminate at the point of detection. They are
/// logged at critical level, all loggers are flushed, and the installed
/// handler runs. The process aborts if the handler returns.

#include "fwd.hpp"
#include <string>

namespace strata_core {

/// Description of a fatal condition
struct FatalInfo {
    const char* expression;
    const char* file;
    int line;
    std::string message;
};

/// Handler invoked on a fatal condition
using FatalHandler = void (*)(const FatalInfo&);

/// Install a fatal handler
/// @return Previously installed handler
FatalHandler set_fatal_handler(FatalHandler handler) noexcept;

/// Currently installed fatal handler
[[nodiscard]] FatalHandler fatal_handler() noexcept;

/// Default handler (logs nothing itself, aborts)
[[noreturn]] void abort_fatal_handler(const FatalInfo& info);

/// Report a fatal condition
[[noreturn]] void fatal_error(const char* expression, const char* file, int line, const std::string& message);

} // namespace strata_core

/// Verify a condition, reporting a fatal error when it does not hold
#define STRATA_VERIFY(cond, msg)                                                    \
    do {                                                                            \
        if (!(cond)) {                                                              \
            ::strata_core::fatal_error(#cond, __FILE__, __LINE__, (msg));           \
        }                                                                           \
    } while (false)

/// Report an unconditional fatal error
#define STRATA_FATAL(msg) ::strata_core::fatal_error("fatal", __FILE__, __LINE__, (msg))
