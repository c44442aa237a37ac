#pragma once

#ifndef TLSCORO_MODULE_EXPORT
#include <functional>
#include <utility>
#endif

#include "concept.hpp"
#include "context.hpp"
#include "context_slot.hpp"
#include "export.hpp"
#include "poll_state.hpp"

TLSCORO_EXPORT namespace tlscoro {
    // Runs func with exclusive access to the context of the poll in progress on
    // this thread. The slot stays empty while func runs, so a nested call
    // terminates unless something inside func installs a context of its own.
    template<typename Func>
    decltype(auto) with_current_context(Func && func) {
        auto guard = context_slot::take();
        return std::invoke(std::forward<Func>(func), guard.get());
    }

    // Runs func with cx as the ambient context, then puts back whatever was
    // installed before.
    template<typename Func>
    decltype(auto) with_context(context & cx, Func && func) {
        auto guard = context_slot::install(cx);
        return std::invoke(std::forward<Func>(func));
    }

    // Polls a nested future with the ambient context instead of an explicit one.
    template<TLSCORO_CONCEPT(future) Future>
    auto poll_with_ambient_context(Future & future) -> poll_state<future_result_t<Future>> {
        TLSCORO_STATIC_ASSERT_FUTURE(Future);
        return with_current_context([&future](context& cx) {
            return future.poll(cx);
        });
    }
}  // namespace tlscoro
