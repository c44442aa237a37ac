#pragma once

#ifndef TLSCORO_MODULE_EXPORT
#include <type_traits>
#include <utility>
#endif

#include "concept.hpp"
#include "context.hpp"
#include "context_slot.hpp"
#include "export.hpp"
#include "poll_state.hpp"

TLSCORO_EXPORT namespace tlscoro {
    // Drives a state machine through the poll interface. The state machine may
    // hold pointers into itself across suspensions, so the adapter cannot be
    // copied or moved: it stays where from_coroutine() materialized it. Wrap
    // it in pinned<> when it has to change owners.
    template<TLSCORO_CONCEPT(state_machine) StateMachine>
    class coroutine_future {
        TLSCORO_STATIC_ASSERT_STATE_MACHINE(StateMachine);

        StateMachine machine_;

      public:
        using result_type = state_machine_result_t<StateMachine>;

        template<typename... Args>
        explicit coroutine_future(std::in_place_t, Args&&... args)
            : machine_(std::forward<Args>(args)...) {}

        explicit coroutine_future(StateMachine machine) : machine_(std::move(machine)) {}

        coroutine_future(const coroutine_future&) = delete;
        coroutine_future& operator=(const coroutine_future&) = delete;
        coroutine_future(coroutine_future&&) = delete;
        coroutine_future& operator=(coroutine_future&&) = delete;

        poll_state<result_type> poll(context& cx) {
            auto guard = context_slot::install(cx);
            auto state = machine_.resume();
            if (state.is_suspended()) {
                return poll_state<result_type>::pending();
            }
            if constexpr (std::is_void_v<result_type>) {
                return poll_state<result_type>::ready();
            } else {
                return poll_state<result_type>::ready(state.take_result());
            }
        }
    };

    template<TLSCORO_CONCEPT(state_machine) StateMachine>
    auto from_coroutine(StateMachine && machine) {
        TLSCORO_STATIC_ASSERT_STATE_MACHINE(StateMachine);
        return coroutine_future<std::decay_t<StateMachine>>(std::forward<StateMachine>(machine));
    }
}  // namespace tlscoro
