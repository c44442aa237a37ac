#pragma once

#ifndef TLSCORO_MODULE_EXPORT
#include <cstdio>
#include <exception>
#endif

namespace tlscoro::detail {
// Broken calling discipline. There is no context to continue with, so this
// never returns and is never reported as an exception.
[[noreturn]] inline void protocol_violation(const char* what) noexcept {
    std::fprintf(stderr, "tlscoro: protocol violation: %s\n", what);
    std::fflush(stderr);
    std::terminate();
}
}  // namespace tlscoro::detail
