#pragma once

#include "context.hpp"
#include "export.hpp"
#include "poll_state.hpp"

TLSCORO_EXPORT namespace tlscoro {
    // Never completes and never wakes anyone.
    template<typename T = void>
    class pending_future {
      public:
        poll_state<T> poll(context&) {
            return poll_state<T>::pending();
        }
    };

    template<typename T = void>
    constexpr auto pending() {
        return pending_future<T>();
    }
}  // namespace tlscoro
