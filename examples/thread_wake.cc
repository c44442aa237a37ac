/*
 * A machine hands the ambient waker to another thread, which wakes the
 * driver later. The driver sleeps on a condition variable in between,
 * so nothing is polled until there is something to do.
 */

#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <tlscoro/ambient.hpp>
#include <tlscoro/context.hpp>
#include <tlscoro/from_coroutine.hpp>
#include <tlscoro/machine.hpp>
#include <tlscoro/poll_state.hpp>

template<typename... Args>
void log(Args&&... args) {
    std::cout << "[" << std::this_thread::get_id() << "] ";
    (std::cout << ... << std::forward<Args>(args)) << "\n";
}

// Becomes ready once another thread has stored a value.
class delivered_value {
    struct shared {
        std::mutex mutex;
        bool started = false;
        bool done = false;
        int value = 0;
    };

    std::shared_ptr<shared> shared_ = std::make_shared<shared>();
    std::thread worker_;

  public:
    delivered_value() = default;

    delivered_value(const delivered_value&) = delete;
    delivered_value& operator=(const delivered_value&) = delete;

    ~delivered_value() {
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    tlscoro::poll_state<int> poll(tlscoro::context& cx) {
        std::lock_guard lock(shared_->mutex);
        if (shared_->done) {
            return tlscoro::poll_state<int>::ready(shared_->value);
        }
        if (!shared_->started) {
            shared_->started = true;
            worker_ = std::thread([state = shared_, w = cx.get_waker()] {
                log("sleeping before delivering...");
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                {
                    std::lock_guard lock(state->mutex);
                    state->value = 42;
                    state->done = true;
                }
                w.wake();
            });
        }
        return tlscoro::poll_state<int>::pending();
    }
};

tlscoro::machine<int> do_work() {
    log("doing work...");
    int value = co_await delivered_value{};
    log("got ", value);
    co_return value * 2;
}

struct driver_waker {
    std::mutex mutex;
    std::condition_variable cv;
    bool notified = false;

    void wake() noexcept {
        {
            std::lock_guard lock(mutex);
            notified = true;
        }
        cv.notify_all();
    }
};

int main() {
    driver_waker wd;
    tlscoro::context cx{tlscoro::waker{wd}};
    auto future = tlscoro::from_coroutine(do_work());

    while (true) {
        {
            std::lock_guard lock(wd.mutex);
            wd.notified = false;
        }

        auto state = future.poll(cx);
        if (state.is_ready()) {
            log("result: ", state.take_result());
            break;
        }

        std::unique_lock lock(wd.mutex);
        wd.cv.wait(lock, [&] {
            return wd.notified;
        });
    }
    return 0;
}
