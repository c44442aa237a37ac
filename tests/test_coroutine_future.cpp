#include "support.hpp"

#include <doctest/doctest.h>

#include <tlscoro/ambient.hpp>
#include <tlscoro/concept.hpp>
#include <tlscoro/context.hpp>
#include <tlscoro/context_slot.hpp>
#include <tlscoro/from_coroutine.hpp>
#include <tlscoro/pinned.hpp>

#include <memory>
#include <stdexcept>
#include <type_traits>
#include <vector>

using tlscoro::context;
using tlscoro::context_slot;
using tlscoro::resume_state;
using tlscoro::waker;
using tlscoro::test::countdown_machine;
using tlscoro::test::observing_machine;
using tlscoro::test::throwing_machine;

namespace {

// Drives a nested adapter with whatever context the outer poll installed.
class nesting_machine {
    tlscoro::pinned<tlscoro::coroutine_future<observing_machine>> inner_;
    const context*& seen_before_inner_;

  public:
    nesting_machine(std::vector<const context*>& inner_seen, const context*& seen_before_inner)
        : inner_(tlscoro::pin_coroutine(observing_machine(inner_seen, 1))),
          seen_before_inner_(seen_before_inner) {}

    resume_state<int> resume() {
        seen_before_inner_ = context_slot::occupant();
        auto state = tlscoro::poll_with_ambient_context(inner_);
        if (state.is_pending()) {
            return resume_state<int>::suspended();
        }
        return resume_state<int>::completed(7);
    }
};

struct destruction_flag {
    bool& destroyed;

    ~destruction_flag() {
        destroyed = true;
    }
};

class owning_machine {
    std::unique_ptr<destruction_flag> flag_;

  public:
    explicit owning_machine(bool& destroyed)
        : flag_(new destruction_flag{destroyed}) {}

    resume_state<> resume() {
        return resume_state<>::suspended();
    }
};

}  // namespace

static_assert(tlscoro::detail::is_state_machine_v<countdown_machine>);
static_assert(tlscoro::detail::is_future_v<tlscoro::coroutine_future<countdown_machine>>);
static_assert(!tlscoro::detail::is_future_v<countdown_machine>);
static_assert(!std::is_move_constructible_v<tlscoro::coroutine_future<countdown_machine>>);
static_assert(!std::is_copy_constructible_v<tlscoro::coroutine_future<countdown_machine>>);
static_assert(std::is_move_constructible_v<tlscoro::pinned<tlscoro::coroutine_future<countdown_machine>>>);

// ============================================================================
// poll contract
// ============================================================================

TEST_SUITE("coroutine_future poll")
{
    TEST_CASE("suspends once then completes with 42")
    {
        context cx{waker{}};
        auto future = tlscoro::from_coroutine(countdown_machine(1, 42));

        auto first = future.poll(cx);
        CHECK(first.is_pending());
        CHECK_FALSE(context_slot::occupied());

        auto second = future.poll(cx);
        REQUIRE(second.is_ready());
        CHECK(second.take_result() == 42);
        CHECK_FALSE(context_slot::occupied());
    }

    TEST_CASE("the context is installed only while the machine runs")
    {
        std::vector<const context*> seen;
        context cx{waker{}};
        auto future = tlscoro::from_coroutine(observing_machine(seen, 2));

        CHECK(future.poll(cx).is_pending());
        CHECK(future.poll(cx).is_pending());
        CHECK(future.poll(cx).is_ready());

        REQUIRE(seen.size() == 3);
        for (auto* observed : seen) {
            CHECK(observed == &cx);
        }
        CHECK_FALSE(context_slot::occupied());
    }

    TEST_CASE("poll restores a context installed by an outer scope")
    {
        context outer{waker{}};
        context inner{waker{}};
        auto installed = context_slot::install(outer);

        auto future = tlscoro::from_coroutine(countdown_machine(0, 1));
        CHECK(future.poll(inner).is_ready());
        CHECK(context_slot::occupant() == &outer);
    }

    TEST_CASE("poll does not wake on its own")
    {
        tlscoro::test::counting_waker counter;
        context cx{waker{counter}};
        auto future = tlscoro::from_coroutine(countdown_machine(3, 0));

        CHECK(future.poll(cx).is_pending());
        CHECK(counter.wakes == 0);
    }

    TEST_CASE("an exception from resume propagates after the slot is restored")
    {
        context outer{waker{}};
        context cx{waker{}};
        auto installed = context_slot::install(outer);

        auto future = tlscoro::from_coroutine(throwing_machine{});
        CHECK_THROWS_AS(future.poll(cx), std::runtime_error);
        CHECK(context_slot::occupant() == &outer);
    }

    TEST_CASE("a completed value representing failure passes through untouched")
    {
        struct failing_result_machine {
            resume_state<std::exception_ptr> resume() {
                return resume_state<std::exception_ptr>::completed(
                    std::make_exception_ptr(std::runtime_error("carried"))
                );
            }
        };

        context cx{waker{}};
        auto future = tlscoro::from_coroutine(failing_result_machine{});
        auto state = future.poll(cx);
        REQUIRE(state.is_ready());
        CHECK(state.take_result() != nullptr);
    }

    TEST_CASE("map transforms a ready value and keeps pending as pending")
    {
        context cx{waker{}};
        auto future = tlscoro::from_coroutine(countdown_machine(1, 20));

        auto doubled = [](int value) {
            return value * 2;
        };
        CHECK(future.poll(cx).map(doubled).is_pending());

        auto state = future.poll(cx).map(doubled);
        REQUIRE(state.is_ready());
        CHECK(state.take_result() == 40);
    }
}

// ============================================================================
// nesting
// ============================================================================

TEST_SUITE("coroutine_future nesting")
{
    TEST_CASE("a nested adapter sees the outer context and the slot unwinds")
    {
        std::vector<const context*> inner_seen;
        const context* seen_before_inner = nullptr;

        context before{waker{}};
        context cx{waker{}};
        auto installed = context_slot::install(before);

        auto outer = tlscoro::from_coroutine(nesting_machine(inner_seen, seen_before_inner));

        CHECK(outer.poll(cx).is_pending());
        CHECK(seen_before_inner == &cx);
        CHECK(context_slot::occupant() == &before);

        auto state = outer.poll(cx);
        REQUIRE(state.is_ready());
        CHECK(state.take_result() == 7);
        CHECK(context_slot::occupant() == &before);

        REQUIRE(inner_seen.size() == 2);
        CHECK(inner_seen[0] == &cx);
        CHECK(inner_seen[1] == &cx);
    }
}

// ============================================================================
// lifetime
// ============================================================================

TEST_SUITE("coroutine_future lifetime")
{
    TEST_CASE("dropping before completion releases the machine and leaves the slot alone")
    {
        bool destroyed = false;
        context cx{waker{}};
        {
            auto future = tlscoro::from_coroutine(owning_machine(destroyed));
            CHECK(future.poll(cx).is_pending());
        }
        CHECK(destroyed);
        CHECK_FALSE(context_slot::occupied());
    }

    TEST_CASE("pinned futures change owners without moving the future")
    {
        context cx{waker{}};
        auto pinned = tlscoro::pin_coroutine(countdown_machine(1, 5));
        auto* address = &pinned.get();

        CHECK(pinned.poll(cx).is_pending());

        std::vector<decltype(pinned)> owners;
        owners.push_back(std::move(pinned));
        CHECK(&owners.front().get() == address);

        auto state = owners.front().poll(cx);
        REQUIRE(state.is_ready());
        CHECK(state.take_result() == 5);
    }

    TEST_CASE("make_pinned builds the future in place")
    {
        context cx{waker{}};
        auto pinned = tlscoro::make_pinned<tlscoro::coroutine_future<countdown_machine>>(
            std::in_place, 0, 9
        );
        REQUIRE(static_cast<bool>(pinned));

        auto state = pinned.poll(cx);
        REQUIRE(state.is_ready());
        CHECK(state.take_result() == 9);
    }
}
