#pragma once

#ifndef TLSCORO_MODULE_EXPORT
#include <optional>
#include <type_traits>
#include <utility>
#endif

#include "export.hpp"

TLSCORO_EXPORT namespace tlscoro {
    // Outcome of a single poll: pending, or ready with the final value.
    template<typename T = void>
    class poll_state {
        constexpr explicit poll_state(T result) : result_(std::move(result)) {}

      public:
        using result_type = T;

        poll_state() = default;

        static constexpr poll_state ready(T result) {
            return poll_state(std::move(result));
        }

        static constexpr poll_state pending() {
            return poll_state();
        }

        bool is_ready() const noexcept {
            return result_.has_value();
        }

        bool is_pending() const noexcept {
            return !result_.has_value();
        }

        T take_result() {
            return std::move(*result_);
        }

        template<typename Func>
        auto map(Func&& func) && {
            using U = std::invoke_result_t<Func, T>;
            if (is_pending()) {
                return poll_state<U>::pending();
            }
            if constexpr (std::is_void_v<U>) {
                func(take_result());
                return poll_state<U>::ready();
            } else {
                return poll_state<U>::ready(func(take_result()));
            }
        }

      private:
        std::optional<T> result_ = std::nullopt;
    };

    template<>
    class poll_state<void> {
        constexpr explicit poll_state(bool ready) : ready_(ready) {}

      public:
        using result_type = void;

        poll_state() = default;

        static constexpr poll_state ready() {
            return poll_state(true);
        }

        static constexpr poll_state pending() {
            return poll_state(false);
        }

        bool is_ready() const noexcept {
            return ready_;
        }

        bool is_pending() const noexcept {
            return !ready_;
        }

        void take_result() {}

        template<typename Func>
        auto map(Func&& func) && {
            using U = std::invoke_result_t<Func>;
            if (is_pending()) {
                return poll_state<U>::pending();
            }
            if constexpr (std::is_void_v<U>) {
                func();
                return poll_state<U>::ready();
            } else {
                return poll_state<U>::ready(func());
            }
        }

      private:
        bool ready_{false};
    };
}  // namespace tlscoro
