#pragma once

#ifndef TLSCORO_MODULE_EXPORT
#include <utility>
#endif

#include "context.hpp"
#include "export.hpp"
#include "poll_state.hpp"

TLSCORO_EXPORT namespace tlscoro {
    template<typename T>
    class ready_future {
        T value_;

      public:
        explicit ready_future(T value) : value_(std::move(value)) {}

        poll_state<T> poll(context&) {
            return poll_state<T>::ready(std::move(value_));
        }
    };

    template<>
    class ready_future<void> {
      public:
        poll_state<> poll(context&) {
            return poll_state<>::ready();
        }
    };

    template<typename T>
    auto ready(T value) {
        return ready_future<T>(std::move(value));
    }

    inline auto ready() {
        return ready_future<void>();
    }
}  // namespace tlscoro
