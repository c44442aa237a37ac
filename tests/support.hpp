#pragma once

#include <tlscoro/concept.hpp>
#include <tlscoro/context.hpp>
#include <tlscoro/context_slot.hpp>
#include <tlscoro/resume_state.hpp>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace tlscoro::test {

struct counting_waker {
    int wakes = 0;

    void wake() noexcept {
        ++wakes;
    }
};

// Suspends a fixed number of times, then completes with a value.
class countdown_machine {
    int suspensions_;
    int value_;

  public:
    countdown_machine(int suspensions, int value) : suspensions_(suspensions), value_(value) {}

    resume_state<int> resume() {
        if (suspensions_ > 0) {
            --suspensions_;
            return resume_state<int>::suspended();
        }
        return resume_state<int>::completed(value_);
    }
};

// Records what the slot held each time it was resumed.
class observing_machine {
    std::vector<const context*>& seen_;
    int suspensions_;

  public:
    observing_machine(std::vector<const context*>& seen, int suspensions)
        : seen_(seen), suspensions_(suspensions) {}

    resume_state<> resume() {
        seen_.push_back(context_slot::occupant());
        if (suspensions_ > 0) {
            --suspensions_;
            return resume_state<>::suspended();
        }
        return resume_state<>::completed();
    }
};

class throwing_machine {
  public:
    resume_state<int> resume() {
        throw std::runtime_error("resume failed");
    }
};

struct child_result {
    int status = 0;
    std::string diagnostics;

    bool aborted() const {
        return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
    }

    bool exited_cleanly() const {
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }
};

// Runs func in a forked child with stderr captured. Lets fatal paths be
// checked without taking the test runner down with them.
template<typename Func>
child_result run_in_child(Func&& func) {
    int fds[2];
    if (::pipe(fds) != 0) {
        throw std::runtime_error("pipe() failed");
    }

    std::fflush(nullptr);
    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error("fork() failed");
    }

    if (pid == 0) {
        ::close(fds[0]);
        ::dup2(fds[1], STDERR_FILENO);
        std::signal(SIGABRT, SIG_DFL);
        std::set_terminate([] {
            std::abort();
        });
        std::forward<Func>(func)();
        std::_Exit(0);
    }

    ::close(fds[1]);
    child_result result;
    char buffer[256];
    ssize_t n;
    while ((n = ::read(fds[0], buffer, sizeof(buffer))) > 0) {
        result.diagnostics.append(buffer, static_cast<size_t>(n));
    }
    ::close(fds[0]);
    ::waitpid(pid, &result.status, 0);
    return result;
}

}  // namespace tlscoro::test
