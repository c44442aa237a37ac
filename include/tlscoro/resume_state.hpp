#pragma once

#ifndef TLSCORO_MODULE_EXPORT
#include <optional>
#include <utility>
#endif

#include "export.hpp"

TLSCORO_EXPORT namespace tlscoro {
    // Outcome of resuming a state machine once. A completed state is terminal.
    template<typename T = void>
    class resume_state {
        constexpr explicit resume_state(T result) : result_(std::move(result)) {}

      public:
        using result_type = T;

        resume_state() = default;

        static constexpr resume_state suspended() {
            return resume_state();
        }

        static constexpr resume_state completed(T result) {
            return resume_state(std::move(result));
        }

        bool is_completed() const noexcept {
            return result_.has_value();
        }

        bool is_suspended() const noexcept {
            return !result_.has_value();
        }

        T take_result() {
            return std::move(*result_);
        }

      private:
        std::optional<T> result_ = std::nullopt;
    };

    template<>
    class resume_state<void> {
        constexpr explicit resume_state(bool completed) : completed_(completed) {}

      public:
        using result_type = void;

        resume_state() = default;

        static constexpr resume_state suspended() {
            return resume_state(false);
        }

        static constexpr resume_state completed() {
            return resume_state(true);
        }

        bool is_completed() const noexcept {
            return completed_;
        }

        bool is_suspended() const noexcept {
            return !completed_;
        }

        void take_result() {}

      private:
        bool completed_{false};
    };
}  // namespace tlscoro
