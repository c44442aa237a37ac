#pragma once

#include "context.hpp"
#include "detail/protocol_violation.hpp"
#include "export.hpp"

// TLSCORO_UNSAFE_SINGLE_THREAD collapses the per-thread slot onto one global
// cell. Only valid when a single thread ever uses this library for the whole
// lifetime of the program; concurrent use is undefined and goes undetected.
#ifndef TLSCORO_UNSAFE_SINGLE_THREAD
#define TLSCORO_UNSAFE_SINGLE_THREAD 0
#endif

TLSCORO_EXPORT namespace tlscoro {
    namespace detail {
    // The pointer outlives the borrow it came from. That is fine as long as
    // every write is undone by a context_guard before the writer returns.
    inline context*& slot_cell() noexcept {
#if TLSCORO_UNSAFE_SINGLE_THREAD
        static context* cell = nullptr;
#else
        static thread_local context* cell = nullptr;
#endif
        return cell;
    }
    }  // namespace detail

    // Puts a removed slot value back when it goes out of scope.
    class context_guard {
        context* saved_;

      public:
        explicit context_guard(context* saved) noexcept : saved_(saved) {}

        context_guard(const context_guard&) = delete;
        context_guard& operator=(const context_guard&) = delete;
        context_guard(context_guard&&) = delete;
        context_guard& operator=(context_guard&&) = delete;

        ~context_guard() {
            detail::slot_cell() = saved_;
        }

        // Only meaningful for guards returned by context_slot::take().
        context& get() const noexcept {
            return *saved_;
        }

        const context* saved() const noexcept {
            return saved_;
        }
    };

    // The ambient poll context of the calling thread. Holds at most one
    // context; nested installs and takes must unwind in stack order, which
    // context_guard takes care of.
    class context_slot {
      public:
        context_slot() = delete;

        static context* replace(context* cx) noexcept {
            auto& cell = detail::slot_cell();
            auto* previous = cell;
            cell = cx;
            return previous;
        }

        [[nodiscard]] static context_guard install(context& cx) noexcept {
            return context_guard(replace(&cx));
        }

        // Clears the slot so nested retrievals fail until the guard fires.
        [[nodiscard]] static context_guard take() noexcept {
            auto* cx = replace(nullptr);
            if (cx == nullptr) {
                detail::protocol_violation(
                    "no poll context is installed on this thread "
                    "(called outside a poll, or the context is already taken)"
                );
            }
            return context_guard(cx);
        }

        static bool occupied() noexcept {
            return detail::slot_cell() != nullptr;
        }

        static const context* occupant() noexcept {
            return detail::slot_cell();
        }
    };
}  // namespace tlscoro
