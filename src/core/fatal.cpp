/// @file fatal.cpp
/// @brief Fatal condition reporting for strata_core

#include <strata/core/fatal.hpp>
#include <strata/core/log.hpp>

#include <atomic>
#include <cstdlib>

namespace strata_core {

namespace {

std::atomic<FatalHandler> s_fatal_handler{&abort_fatal_handler};

} // anonymous namespace

FatalHandler set_fatal_handler(FatalHandler handler) noexcept {
    if (!handler) {
        handler = &abort_fatal_handler;
    }
    return s_fatal_handler.exchange(handler);
}

FatalHandler fatal_handler() noexcept {
    return s_fatal_handler.load();
}

void abort_fatal_handler(const FatalInfo&) {
    std::abort();
}

void fatal_error(const char* expression, const char* file, int line, const std::string& message) {
    core_logger()->critical("{} ({}) at {}:{}", message, expression, file, line);
    flush_all_loggers();

    FatalInfo info{expression, file, line, message};
    s_fatal_handler.load()(info);

    // Handlers are expected not to return
    std::abort();
}

} // namespace strata_core
