#include <atomic>
#include <chrono>
#include <future>
#include <initializer_list>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include "app/termination_watcher.hpp"

namespace {

using wrapmcp::app::TerminationWatcher;

// Blocks the given signals in the calling thread until destroyed. Threads
// started meanwhile inherit the mask.
class BlockedSignals {
public:
    explicit BlockedSignals(std::initializer_list<int> numbers) {
        sigemptyset(&set_);
        for (const int number : numbers) {
            sigaddset(&set_, number);
        }
        pthread_sigmask(SIG_BLOCK, &set_, &previous_);
    }
    ~BlockedSignals() { pthread_sigmask(SIG_SETMASK, &previous_, nullptr); }

    const sigset_t& set() const { return set_; }

private:
    sigset_t set_;
    sigset_t previous_;
};

TEST(TerminationWatcherTest, DestructionJoinsWithoutRunningCallback) {
    BlockedSignals blocked({SIGUSR1, SIGUSR2});
    std::atomic_int calls{0};
    {
        TerminationWatcher watcher(blocked.set(), SIGUSR1, [&calls](int) { ++calls; });
    }
    EXPECT_EQ(calls.load(), 0);
}

TEST(TerminationWatcherTest, DestructionRightAfterStartStillJoins) {
    BlockedSignals blocked({SIGUSR1, SIGUSR2});
    std::atomic_int calls{0};
    for (int i = 0; i < 20; ++i) {
        TerminationWatcher watcher(blocked.set(), SIGUSR1, [&calls](int) { ++calls; });
    }
    EXPECT_EQ(calls.load(), 0);
}

TEST(TerminationWatcherTest, DeliversSignalToCallback) {
    BlockedSignals blocked({SIGUSR1, SIGUSR2});
    std::promise<int> delivered;
    auto future = delivered.get_future();
    TerminationWatcher watcher(blocked.set(), SIGUSR1,
                               [&delivered](const int number) { delivered.set_value(number); });

    ASSERT_EQ(kill(getpid(), SIGUSR2), 0);
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(future.get(), SIGUSR2);
}

}  // namespace
