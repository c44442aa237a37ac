#pragma once

#ifndef TLSCORO_MODULE_EXPORT
#include <cstdint>
#endif

#include "context.hpp"
#include "export.hpp"
#include "poll_state.hpp"

TLSCORO_EXPORT namespace tlscoro {
    // Reports pending `count` times, asking to be polled again each time.
    class yield_future {
        uint32_t remaining_{1};

      public:
        yield_future() = default;

        explicit yield_future(uint32_t count) : remaining_(count) {}

        poll_state<> poll(context& cx) {
            if (remaining_ == 0) {
                return poll_state<>::ready();
            }
            remaining_--;
            cx.wake();
            return poll_state<>::pending();
        }
    };

    inline auto yield_now(uint32_t count = 1) {
        return yield_future(count);
    }
}  // namespace tlscoro
