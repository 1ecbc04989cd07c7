#include <gtest/gtest.h>
#include "shadow_flags.hpp"
#include "status_snapshot.hpp"

using namespace robot;

TEST(ShadowFlagsTest, UnsetPassesRawFlagsThrough) {
    ShadowFlags shadow;
    EXPECT_EQ(shadow.apply(0), 0u);
    EXPECT_EQ(shadow.apply(flags::kMoving | flags::kCrashed), flags::kMoving | flags::kCrashed);
}

// Pending set forces the bit until the robot reports it
TEST(ShadowFlagsTest, PendingSetUntilConfirmed) {
    ShadowFlags shadow;
    shadow.request_set(ShadowFlag::Moving);
    EXPECT_TRUE(shadow.pending_set(ShadowFlag::Moving));

    EXPECT_EQ(shadow.apply(0), flags::kMoving);
    EXPECT_EQ(shadow.apply(0), flags::kMoving);
    EXPECT_EQ(shadow.apply(flags::kMoving), flags::kMoving);
    EXPECT_EQ(shadow.state(ShadowFlag::Moving), ShadowState::Confirmed);

    // Robot is authoritative again
    EXPECT_EQ(shadow.apply(0), 0u);
}

TEST(ShadowFlagsTest, PendingClearUntilConfirmed) {
    ShadowFlags shadow;
    shadow.request_clear(ShadowFlag::SoundPlaying);
    EXPECT_EQ(shadow.apply(flags::kSoundPlaying | flags::kCrashed), flags::kCrashed);
    EXPECT_TRUE(shadow.pending_clear(ShadowFlag::SoundPlaying));
    EXPECT_EQ(shadow.apply(flags::kCrashed), flags::kCrashed);
    EXPECT_EQ(shadow.state(ShadowFlag::SoundPlaying), ShadowState::Confirmed);
    EXPECT_EQ(shadow.apply(flags::kSoundPlaying), flags::kSoundPlaying);
}

// An override that is never confirmed expires after hold_limit snapshots
TEST(ShadowFlagsTest, PendingExpiresAfterHoldLimit) {
    ShadowFlags shadow(3);
    shadow.request_set(ShadowFlag::TurnActive);
    EXPECT_EQ(shadow.apply(0), flags::kTurnActive);
    EXPECT_EQ(shadow.apply(0), flags::kTurnActive);
    EXPECT_EQ(shadow.apply(0), flags::kTurnActive);
    EXPECT_EQ(shadow.state(ShadowFlag::TurnActive), ShadowState::Unset);
    EXPECT_EQ(shadow.apply(0), 0u);
}

TEST(ShadowFlagsTest, CancelDropsOverride) {
    ShadowFlags shadow;
    shadow.request_set(ShadowFlag::MoveActive);
    shadow.request_set(ShadowFlag::ImuCalibrating);
    shadow.cancel(ShadowFlag::MoveActive);
    EXPECT_EQ(shadow.apply(0), flags::kImuCalibrating);

    shadow.cancel_all();
    EXPECT_EQ(shadow.state(ShadowFlag::ImuCalibrating), ShadowState::Unset);
    EXPECT_EQ(shadow.apply(0), 0u);
}

// A new request restarts the hold count
TEST(ShadowFlagsTest, RequestRestartsHold) {
    ShadowFlags shadow(2);
    shadow.request_set(ShadowFlag::Moving);
    shadow.apply(0);
    shadow.request_set(ShadowFlag::Moving);
    EXPECT_EQ(shadow.apply(0), flags::kMoving);
    EXPECT_TRUE(shadow.pending_set(ShadowFlag::Moving));
}

TEST(ShadowFlagsTest, BitsAndNames) {
    EXPECT_EQ(flag_bit(ShadowFlag::SoundDownloading), flags::kSoundDownloading);
    EXPECT_EQ(flag_bit(ShadowFlag::ImuCalibrating), flags::kImuCalibrating);
    EXPECT_STREQ(flag_name(ShadowFlag::TurnActive), "turn_active");
    EXPECT_EQ(ShadowFlags(0).hold_limit(), 1);
}
