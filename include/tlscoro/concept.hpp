#pragma once

#ifndef TLSCORO_MODULE_EXPORT
#include <type_traits>
#include <utility>
#endif

#include "context.hpp"
#include "export.hpp"
#include "poll_state.hpp"
#include "resume_state.hpp"

#if defined(__cpp_concepts) && __cpp_concepts >= 201907L && \
    (!defined(TLSCORO_USE_CONCEPTS) || TLSCORO_USE_CONCEPTS)
#define TLSCORO_CONCEPT(name) name
#ifndef TLSCORO_USE_CONCEPTS
#define TLSCORO_USE_CONCEPTS 1
#endif
#ifndef TLSCORO_MODULE_EXPORT
#include <concepts>
#endif
#else
#define TLSCORO_CONCEPT(name) typename
#undef TLSCORO_USE_CONCEPTS
#define TLSCORO_USE_CONCEPTS 0
#endif

TLSCORO_EXPORT namespace tlscoro {
    namespace detail {
    template<typename T>
    inline constexpr bool is_poll_state_v = false;

    template<typename T>
    inline constexpr bool is_poll_state_v<poll_state<T>> = true;

    template<typename T>
    inline constexpr bool is_resume_state_v = false;

    template<typename T>
    inline constexpr bool is_resume_state_v<resume_state<T>> = true;

    template<typename T>
    using poll_result_t = decltype(std::declval<T&>().poll(std::declval<context&>()));

    template<typename T>
    using resume_result_t = decltype(std::declval<T&>().resume());

    template<typename T, typename = void>
    struct future_traits : std::false_type {};

    template<typename T>
    struct future_traits<T, std::void_t<poll_result_t<T>>>
        : std::bool_constant<is_poll_state_v<poll_result_t<T>>> {};

    template<typename T, typename = void>
    struct state_machine_traits : std::false_type {};

    template<typename T>
    struct state_machine_traits<T, std::void_t<resume_result_t<T>>>
        : std::bool_constant<is_resume_state_v<resume_result_t<T>>> {};

    template<typename T>
    inline constexpr bool is_future_v = future_traits<std::remove_reference_t<T>>::value;

    template<typename T>
    inline constexpr bool is_state_machine_v =
        state_machine_traits<std::remove_reference_t<T>>::value;
    }  // namespace detail

#if TLSCORO_USE_CONCEPTS
    // Something a driver can poll with a context.
    template<typename T>
    concept future = requires(T& t, context& cx) { t.poll(cx); } && detail::is_future_v<T>;

    // Something that can be resumed once at a time until it completes.
    template<typename T>
    concept state_machine = requires(T& t) { t.resume(); } && detail::is_state_machine_v<T>;
#endif

#define TLSCORO_STATIC_ASSERT_FUTURE(type)                      \
    static_assert(                                              \
        tlscoro::detail::is_future_v<type>,                     \
        "The type does not satisfy the future concept"          \
    )

#define TLSCORO_STATIC_ASSERT_STATE_MACHINE(type)               \
    static_assert(                                              \
        tlscoro::detail::is_state_machine_v<type>,              \
        "The type does not satisfy the state_machine concept"   \
    )

    template<TLSCORO_CONCEPT(future) Future>
    using future_result_t =
        typename detail::poll_result_t<std::remove_reference_t<Future>>::result_type;

    template<TLSCORO_CONCEPT(state_machine) StateMachine>
    using state_machine_result_t =
        typename detail::resume_result_t<std::remove_reference_t<StateMachine>>::result_type;
}  // namespace tlscoro
