#pragma once

#ifndef TLSCORO_MODULE_EXPORT
#include <coroutine>
#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#endif

#include "ambient.hpp"
#include "concept.hpp"
#include "detail/protocol_violation.hpp"
#include "export.hpp"
#include "resume_state.hpp"

TLSCORO_EXPORT namespace tlscoro {
    // Awaited inside a machine to hand control back to whoever resumed it.
    struct suspend_point {
        constexpr bool await_ready() const noexcept {
            return false;
        }

        constexpr void await_suspend(std::coroutine_handle<>) const noexcept {}

        constexpr void await_resume() const noexcept {}
    };

    constexpr suspend_point suspend() noexcept {
        return {};
    }

    namespace detail {
    struct machine_promise_base {
        std::exception_ptr exception{nullptr};
        // Set while the body is parked on a pending future.
        std::function<bool()> pending_poll{nullptr};

        bool poll_pending() {
            if (pending_poll) {
                return pending_poll();
            }
            return true;
        }
    };

    template<typename T>
    class machine_storage {
        std::optional<T> result;

      public:
        void return_value(T value) {
            result = std::move(value);
        }

        T take_result() {
            auto value = std::move(*result);
            result = std::nullopt;
            return value;
        }
    };

    template<>
    class machine_storage<void> {
      public:
        void return_void() {}
    };

    // co_await on a future inside a machine: poll it with the ambient context,
    // park the body while it is pending and re-poll on every resume.
    template<TLSCORO_CONCEPT(future) Future>
    class ambient_awaiter {
        using result_type = future_result_t<Future>;
        using storage_type =
            std::conditional_t<std::is_void_v<result_type>, std::monostate, result_type>;

        machine_promise_base& promise_;
        Future& future_;
        std::optional<storage_type> result_;
        std::exception_ptr exception_{nullptr};

        bool poll_once() {
            try {
                auto state = poll_with_ambient_context(future_);
                if (state.is_pending()) {
                    return false;
                }
                if constexpr (std::is_void_v<result_type>) {
                    state.take_result();
                    result_.emplace();
                } else {
                    result_.emplace(state.take_result());
                }
            } catch (...) {
                // Rethrown at the co_await site by await_resume().
                exception_ = std::current_exception();
            }
            return true;
        }

      public:
        ambient_awaiter(machine_promise_base& promise, Future& future)
            : promise_(promise), future_(future) {}

        bool await_ready() {
            return poll_once();
        }

        void await_suspend(std::coroutine_handle<>) {
            promise_.pending_poll = [this] {
                return poll_once();
            };
        }

        result_type await_resume() {
            promise_.pending_poll = nullptr;
            if (exception_) {
                std::rethrow_exception(exception_);
            }
            if constexpr (!std::is_void_v<result_type>) {
                return std::move(*result_);
            }
        }
    };
    }  // namespace detail

    // Coroutine return type that exposes the compiler-generated state machine
    // through resume(). Must be resumed from inside a poll (see from_coroutine)
    // as soon as its body awaits a future.
    template<typename T = void>
    class machine {
      public:
        struct promise_type : detail::machine_promise_base, detail::machine_storage<T> {
            machine get_return_object() {
                return machine(std::coroutine_handle<promise_type>::from_promise(*this));
            }

            std::suspend_always initial_suspend() noexcept {
                return {};
            }

            std::suspend_always final_suspend() noexcept {
                return {};
            }

            void unhandled_exception() {
                this->exception = std::current_exception();
            }

            suspend_point await_transform(suspend_point point) noexcept {
                return point;
            }

            template<TLSCORO_CONCEPT(future) Future>
            auto await_transform(Future&& future) {
                TLSCORO_STATIC_ASSERT_FUTURE(Future);
                return detail::ambient_awaiter<std::remove_reference_t<Future>>(*this, future);
            }
        };

        explicit machine(std::coroutine_handle<promise_type> handle) noexcept : handle_(handle) {}

        machine(machine&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

        machine& operator=(machine&& other) noexcept {
            if (this != &other) {
                if (handle_) {
                    handle_.destroy();
                }
                handle_ = std::exchange(other.handle_, nullptr);
            }
            return *this;
        }

        machine(const machine&) = delete;
        machine& operator=(const machine&) = delete;

        ~machine() {
            if (handle_) {
                handle_.destroy();
            }
        }

        resume_state<T> resume() {
            if (done()) {
                detail::protocol_violation("machine resumed after it completed");
            }

            auto& promise = handle_.promise();
            if (!promise.poll_pending()) {
                return resume_state<T>::suspended();
            }

            handle_.resume();
            if (!handle_.done()) {
                return resume_state<T>::suspended();
            }

            if (promise.exception) {
                std::rethrow_exception(std::exchange(promise.exception, nullptr));
            }
            if constexpr (std::is_void_v<T>) {
                return resume_state<T>::completed();
            } else {
                return resume_state<T>::completed(promise.take_result());
            }
        }

        bool done() const noexcept {
            return !handle_ || handle_.done();
        }

      private:
        std::coroutine_handle<promise_type> handle_;
    };
}  // namespace tlscoro
