#include <iostream>
#include <stdexcept>
#include <tlscoro/context.hpp>
#include <tlscoro/context_slot.hpp>
#include <tlscoro/from_coroutine.hpp>
#include <tlscoro/machine.hpp>

tlscoro::machine<int> async_divide(int a, int b) {
    co_await tlscoro::suspend();
    if (b == 0) {
        throw std::runtime_error("division by zero");
    }
    co_return a / b;
}

tlscoro::machine<int> do_work() {
    try {
        co_return co_await tlscoro::from_coroutine(async_divide(10, 0));
    } catch (const std::runtime_error& e) {
        std::cout << "Caught exception at do_work: " << e.what() << std::endl;
        throw;
    }
}

int main() {
    tlscoro::context cx{tlscoro::waker{}};
    auto future = tlscoro::from_coroutine(do_work());

    try {
        while (future.poll(cx).is_pending()) {
        }
    } catch (const std::runtime_error& e) {
        std::cout << "Caught exception at main: " << e.what() << std::endl;
        std::cout << "Context installed: " << std::boolalpha
                  << tlscoro::context_slot::occupied() << std::endl;
        return 1;
    }
    return 0;
}
