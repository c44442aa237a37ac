#pragma once

#ifndef TLSCORO_MODULE_EXPORT
#include <memory>
#include <type_traits>
#include <utility>
#endif

#include "concept.hpp"
#include "context.hpp"
#include "export.hpp"
#include "from_coroutine.hpp"
#include "poll_state.hpp"

TLSCORO_EXPORT namespace tlscoro {
    // Owns a future at a fixed heap address. Moving a pinned<> hands over the
    // pointer; the future itself is never relocated after construction.
    template<TLSCORO_CONCEPT(future) Future>
    class pinned {
        TLSCORO_STATIC_ASSERT_FUTURE(Future);

        std::unique_ptr<Future> future_;

      public:
        using result_type = future_result_t<Future>;

        explicit pinned(std::unique_ptr<Future> future) noexcept : future_(std::move(future)) {}

        pinned(pinned&&) noexcept = default;
        pinned& operator=(pinned&&) noexcept = default;

        pinned(const pinned&) = delete;
        pinned& operator=(const pinned&) = delete;

        poll_state<result_type> poll(context& cx) {
            return future_->poll(cx);
        }

        Future& get() noexcept {
            return *future_;
        }

        explicit operator bool() const noexcept {
            return future_ != nullptr;
        }
    };

    template<typename Future, typename... Args>
    pinned<Future> make_pinned(Args && ... args) {
        return pinned<Future>(std::make_unique<Future>(std::forward<Args>(args)...));
    }

    template<TLSCORO_CONCEPT(state_machine) StateMachine>
    auto pin_coroutine(StateMachine && machine) {
        TLSCORO_STATIC_ASSERT_STATE_MACHINE(StateMachine);
        using future_type = coroutine_future<std::decay_t<StateMachine>>;
        return make_pinned<future_type>(std::in_place, std::forward<StateMachine>(machine));
    }
}  // namespace tlscoro
