#include <chrono>
#include <gtest/gtest.h>
#include "watch/file_watch_state.hpp"

namespace {

using wrapmcp::watch::FileWatchState;
using wrapmcp::watch::WatchAction;
using wrapmcp::watch::WatchEvent;
using wrapmcp::watch::WatchPhase;
using Clock = FileWatchState::Clock;
using std::chrono::milliseconds;

class FileWatchStateTest : public ::testing::Test {
protected:
    Clock::time_point at(const int ms) const { return origin_ + milliseconds(ms); }

    Clock::time_point origin_ = Clock::now();
};

TEST_F(FileWatchStateTest, StartsTrackingWhenFileExists) {
    FileWatchState state(true);
    EXPECT_EQ(state.phase(), WatchPhase::Tracking);
    EXPECT_FALSE(state.pending().has_value());
}

TEST_F(FileWatchStateTest, FirstCreationSchedulesInitialStartOnce) {
    FileWatchState state(false);
    EXPECT_EQ(state.phase(), WatchPhase::AwaitingFirstCreation);

    state.on_event(WatchEvent::Created, true, at(0));
    EXPECT_EQ(state.phase(), WatchPhase::Tracking);
    EXPECT_EQ(state.pending(), WatchAction::InitialStart);

    EXPECT_FALSE(state.poll(true, at(1999)).has_value());
    EXPECT_EQ(state.poll(true, at(2000)), WatchAction::InitialStart);
    EXPECT_FALSE(state.poll(true, at(5000)).has_value());

    // Later creations are restarts.
    state.on_event(WatchEvent::Removed, false, at(6000));
    state.on_event(WatchEvent::Created, true, at(6100));
    EXPECT_EQ(state.poll(true, at(8100)), WatchAction::Restart);
}

TEST_F(FileWatchStateTest, CreatedIgnoredWhenPathStillMissing) {
    FileWatchState state(false);
    state.on_event(WatchEvent::Created, false, at(0));
    EXPECT_EQ(state.phase(), WatchPhase::AwaitingFirstCreation);
    EXPECT_FALSE(state.pending().has_value());
}

TEST_F(FileWatchStateTest, ModifyIgnoredWhileAwaitingFirstCreation) {
    FileWatchState state(false);
    state.on_event(WatchEvent::Modified, false, at(0));
    EXPECT_FALSE(state.pending().has_value());
}

TEST_F(FileWatchStateTest, BurstOfModificationsFiresOnceAfterQuiescence) {
    FileWatchState state(true);
    for (int i = 0; i < 10; ++i) {
        state.on_event(WatchEvent::Modified, true, at(i * 500));
        EXPECT_FALSE(state.poll(true, at(i * 500 + 100)).has_value());
    }
    // Last event at 4500 ms.
    EXPECT_FALSE(state.poll(true, at(6400)).has_value());
    EXPECT_EQ(state.poll(true, at(6500)), WatchAction::Restart);
    EXPECT_FALSE(state.poll(true, at(9000)).has_value());
}

TEST_F(FileWatchStateTest, RemovalCancelsPendingAndBlocksModify) {
    FileWatchState state(true);
    state.on_event(WatchEvent::Modified, true, at(0));
    state.on_event(WatchEvent::Removed, false, at(100));
    EXPECT_TRUE(state.file_deleted());
    EXPECT_FALSE(state.pending().has_value());

    state.on_event(WatchEvent::Modified, false, at(200));
    EXPECT_FALSE(state.poll(true, at(5000)).has_value());

    state.on_event(WatchEvent::Created, true, at(5000));
    EXPECT_FALSE(state.file_deleted());
    EXPECT_EQ(state.poll(true, at(7000)), WatchAction::Restart);
}

TEST_F(FileWatchStateTest, MissingFileAtFireTimeKeepsActionPending) {
    FileWatchState state(true);
    state.on_event(WatchEvent::Modified, true, at(0));
    EXPECT_FALSE(state.poll(false, at(3000)).has_value());
    EXPECT_EQ(state.pending(), WatchAction::Restart);
    EXPECT_EQ(state.poll(true, at(3100)), WatchAction::Restart);
}

TEST_F(FileWatchStateTest, ModifyKeepsPendingInitialStart) {
    FileWatchState state(false);
    state.on_event(WatchEvent::Created, true, at(0));
    state.on_event(WatchEvent::Modified, true, at(1500));
    EXPECT_FALSE(state.poll(true, at(3000)).has_value());
    EXPECT_EQ(state.poll(true, at(3500)), WatchAction::InitialStart);
}

TEST_F(FileWatchStateTest, RenameOverTrackedFileCountsAsModification) {
    FileWatchState state(true);
    state.on_event(WatchEvent::Created, true, at(0));
    EXPECT_EQ(state.pending(), WatchAction::Restart);
}

}  // namespace
