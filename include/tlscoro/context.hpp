#pragma once

#ifndef TLSCORO_MODULE_EXPORT
#include <type_traits>
#endif

#include "export.hpp"

TLSCORO_EXPORT namespace tlscoro {
    namespace detail {

    template<typename WakerType>
    inline void waker_wake_function(void* data) noexcept {
        static_cast<WakerType*>(data)->wake();
    }

    }  // namespace detail

    // Type-erased wake capability. A default constructed waker does nothing.
    class waker {
        void (*wake_function_)(void*) = nullptr;
        void* data_ = nullptr;

      public:
        waker() = default;

        waker(void* data, void (*wake_function)(void*)) noexcept
            : wake_function_(wake_function), data_(data) {}

        template<
            typename WakerType,
            std::enable_if_t<!std::is_same_v<std::remove_cv_t<WakerType>, waker>, int> = 0>
        explicit waker(WakerType& ref) noexcept
            : wake_function_(&detail::waker_wake_function<WakerType>),
              data_(static_cast<void*>(&ref)) {}

        void wake() const noexcept {
            if (wake_function_) {
                wake_function_(data_);
            }
        }

        bool will_wake(const waker& other) const noexcept {
            return data_ == other.data_ && wake_function_ == other.wake_function_;
        }
    };

    // The poll context handed to a future by its driver. Lives on the driver's
    // stack for one poll call and is only ever borrowed.
    class context {
        waker waker_;

      public:
        explicit context(waker w) noexcept : waker_(w) {}

        context(const context&) = delete;
        context& operator=(const context&) = delete;
        context(context&&) = delete;
        context& operator=(context&&) = delete;

        const waker& get_waker() const noexcept {
            return waker_;
        }

        void wake() const noexcept {
            waker_.wake();
        }
    };
}  // namespace tlscoro
