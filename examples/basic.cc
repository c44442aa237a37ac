/*
 * A hand-written state machine driven through the poll interface.
 * The driver owns the context; the machine never sees it as a parameter.
 */

#include <iostream>
#include <tlscoro/context.hpp>
#include <tlscoro/context_slot.hpp>
#include <tlscoro/from_coroutine.hpp>
#include <tlscoro/resume_state.hpp>

class countdown {
    int remaining_;

  public:
    explicit countdown(int from) : remaining_(from) {}

    tlscoro::resume_state<int> resume() {
        std::cout << "resume: remaining=" << remaining_
                  << " context installed=" << std::boolalpha
                  << tlscoro::context_slot::occupied() << std::endl;
        if (remaining_ > 0) {
            remaining_--;
            return tlscoro::resume_state<int>::suspended();
        }
        return tlscoro::resume_state<int>::completed(42);
    }
};

int main() {
    tlscoro::context cx{tlscoro::waker{}};
    auto future = tlscoro::from_coroutine(countdown(2));

    while (true) {
        auto state = future.poll(cx);
        if (state.is_ready()) {
            std::cout << "ready: " << state.take_result() << std::endl;
            break;
        }
        std::cout << "pending" << std::endl;
    }

    std::cout << "context installed after poll=" << tlscoro::context_slot::occupied()
              << std::endl;
    return 0;
}
