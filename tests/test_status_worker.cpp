#include <gtest/gtest.h>
#include "fake_connection.hpp"
#include "status_worker.hpp"
#include <atomic>
#include <memory>
#include <string>

using namespace robot;

namespace {

std::string status_json(const std::string& flags, const std::string& touch = "0x0000", double heading = 90.0)
{
    return std::string("{\"controller\":{\"flags\":\"0x0000\",\"stick_x\":0,\"stick_y\":0,\"battery\":0},") +
           "\"robot\":{\"flags\":\"" + flags + "\",\"battery\":87,\"touch_flags\":\"" + touch +
           "\",\"touch_x\":\"120.5\",\"touch_y\":44,\"robot_x\":10,\"robot_y\":-20,\"heading\":" +
           std::to_string(heading) + ",\"rotation\":450,\"acceleration\":{\"x\":0.1,\"y\":0,\"z\":-1}," +
           "\"screen\":{\"row\":3,\"column\":7}}," +
           "\"aivision\":{\"classnames\":{\"count\":2,\"items\":[{\"index\":0,\"name\":\"SportsBall\"}," +
           "{\"index\":1,\"name\":\"BlueBarrel\"}]},\"objects\":{\"count\":1,\"items\":[{\"type\":4,\"id\":1," +
           "\"originx\":100,\"originy\":170,\"width\":40,\"height\":50,\"score\":93}]}}}";
}

class StatusWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        state = std::make_shared<FakeConnection::State>();
        state->responder = [this](const std::string& probe) -> std::string {
            probes_ok = probe.size() == 1 && probe[0] == 1;
            return reply;
        };
        cfg.status_loss_limit = 5;
        worker.reset(new StatusWorker("ws://robot/ws_status", std::make_unique<FakeConnection>(state), cfg, token));
        ASSERT_TRUE(worker->connect(100));
    }

    std::shared_ptr<FakeConnection::State> state;
    ClientConfig cfg;
    CancellationToken token;
    std::string reply = status_json("0x0000");
    std::atomic<bool> probes_ok{false};
    std::unique_ptr<StatusWorker> worker;
};

} // namespace

TEST(StatusSnapshotTest, EmptySnapshotDefaults) {
    StatusSnapshot s = empty_snapshot();
    EXPECT_TRUE(s.empty);
    EXPECT_EQ(s.robot.flags, 0u);
    EXPECT_EQ(s.robot.screen_row, 1);
    ASSERT_EQ(s.vision.classnames.size(), 4u);
    EXPECT_EQ(s.vision.classnames[3], "Robot");
}

TEST(StatusSnapshotTest, ParseHexFlags) {
    uint32_t v = 0;
    EXPECT_TRUE(parse_hex_flags("0x0420", v));
    EXPECT_EQ(v, 0x420u);
    EXPECT_TRUE(parse_hex_flags("ff", v));
    EXPECT_EQ(v, 0xFFu);
    EXPECT_FALSE(parse_hex_flags("0x", v));
    EXPECT_FALSE(parse_hex_flags("12g4", v));
    EXPECT_FALSE(parse_hex_flags("0x123456789", v));
}

// Numbers may arrive as strings; the object list is bounded by count
TEST(StatusSnapshotTest, DecodeFullPayload) {
    StatusSnapshot s;
    std::string error;
    ASSERT_TRUE(decode_snapshot(status_json("0x0421", "0x0001"), s, &error)) << error;
    EXPECT_FALSE(s.empty);
    EXPECT_EQ(s.robot.flags, 0x421u);
    EXPECT_TRUE(s.has_flag(flags::kProgramActive));
    EXPECT_TRUE(s.touch_pressed());
    EXPECT_DOUBLE_EQ(s.robot.touch_x, 120.5);
    EXPECT_EQ(s.robot.battery, 87);
    EXPECT_DOUBLE_EQ(s.robot.acceleration.z, -1.0);
    EXPECT_EQ(s.robot.screen_column, 7);
    ASSERT_EQ(s.vision.objects.size(), 1u);
    EXPECT_EQ(s.vision.objects[0].origin_y, 170);
    EXPECT_EQ(s.vision.objects[0].score, 93);
    ASSERT_GE(s.vision.classnames.size(), 2u);
    EXPECT_EQ(s.vision.classnames[1], "BlueBarrel");
}

TEST(StatusSnapshotTest, DecodeRejectsGarbage) {
    StatusSnapshot s;
    std::string error;
    EXPECT_FALSE(decode_snapshot("not json", s, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(decode_snapshot("[1,2]", s, &error));
    EXPECT_FALSE(decode_snapshot("{\"robot\":{\"flags\":\"zz\"}}", s, &error));
}

// Test untrusted sizes and numbers from the robot
TEST(StatusSnapshotTest, DecodeBoundsUntrustedValues) {
    StatusSnapshot s;
    std::string error;
    EXPECT_TRUE(decode_snapshot(R"({"aivision":{"classnames":{"items":[)"
                                R"({"index":1,"name":"BlueBarrel"},{"index":2000000000,"name":"Huge"}]}}})",
                                s, &error));
    EXPECT_EQ(s.vision.classnames.size(), 2u);
    EXPECT_FALSE(decode_snapshot(R"({"robot":{"battery":1e300}})", s, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(decode_snapshot(R"({"aivision":{"objects":{"count":1,"items":[{"id":"-9e99"}]}}})", s, &error));
}

// Probe, receive, publish
TEST_F(StatusWorkerTest, PollPublishesFreshSnapshot) {
    EXPECT_TRUE(worker->snapshot()->empty);
    worker->poll_once();
    EXPECT_TRUE(probes_ok);
    EXPECT_EQ(worker->sequence(), 1u);
    auto snap = worker->snapshot();
    EXPECT_FALSE(snap->empty);
    EXPECT_DOUBLE_EQ(snap->robot.heading, 90.0);
    EXPECT_EQ(worker->packets_lost(), 0);
    auto sent = state->sent_copy();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].second, ws::Opcode::Binary);
}

// Up to the loss limit the last snapshot is kept, then it becomes empty
TEST_F(StatusWorkerTest, LossesPublishEmptyAfterLimit) {
    worker->poll_once();
    auto good = worker->snapshot();
    reply.clear(); // robot stops answering

    for (int i = 1; i <= 5; ++i) {
        worker->poll_once();
        EXPECT_EQ(worker->packets_lost(), i);
        EXPECT_EQ(worker->snapshot(), good);
    }
    worker->poll_once();
    EXPECT_EQ(worker->packets_lost(), 6);
    EXPECT_TRUE(worker->snapshot()->empty);
    // Empty snapshot does not count as fresh
    EXPECT_EQ(worker->sequence(), 1u);
}

TEST_F(StatusWorkerTest, UndecodablePayloadCountsAsLoss) {
    reply = "{broken";
    worker->poll_once();
    EXPECT_EQ(worker->packets_lost(), 1);
    EXPECT_TRUE(worker->snapshot()->empty);
    reply = status_json("0x0000");
    worker->poll_once();
    EXPECT_EQ(worker->packets_lost(), 0);
}

TEST_F(StatusWorkerTest, ShadowOverrideIsMerged) {
    worker->shadow().request_set(ShadowFlag::Moving);
    worker->poll_once();
    EXPECT_TRUE(worker->snapshot()->has_flag(flags::kMoving));
    reply = status_json("0x0020");
    worker->poll_once();
    EXPECT_EQ(worker->shadow().state(ShadowFlag::Moving), ShadowState::Confirmed);
    reply = status_json("0x0000");
    worker->poll_once();
    EXPECT_FALSE(worker->snapshot()->has_flag(flags::kMoving));
}

// Press and release fire on transitions only
TEST_F(StatusWorkerTest, ScreenPressAndReleaseEdges) {
    int pressed = 0, released = 0, status = 0;
    worker->on_screen_pressed([&] { ++pressed; });
    worker->on_screen_released([&] { ++released; });
    worker->on_status([&] { ++status; });

    worker->poll_once();
    reply = status_json("0x0000", "0x0001");
    worker->poll_once();
    worker->poll_once();
    EXPECT_EQ(pressed, 1);
    EXPECT_EQ(released, 0);
    reply = status_json("0x0000", "0x0000");
    worker->poll_once();
    EXPECT_EQ(released, 1);
    EXPECT_EQ(status, 4);
}

// Crash fires for every snapshot with the bit set; a throwing callback is contained
TEST_F(StatusWorkerTest, CrashCallbackIsLevelTriggered) {
    int crashes = 0;
    worker->on_crash([&] { ++crashes; });
    worker->on_crash([] { throw std::runtime_error("boom"); });
    reply = status_json("0x0040");
    worker->poll_once();
    worker->poll_once();
    EXPECT_EQ(crashes, 2);
    reply = status_json("0x0000");
    worker->poll_once();
    EXPECT_EQ(crashes, 2);
}

TEST_F(StatusWorkerTest, PowerButtonCancels) {
    reply = status_json("0x0200");
    worker->poll_once();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_EQ(token.reason(), "power button pressed");
}

TEST_F(StatusWorkerTest, ProgramEndingCancels) {
    reply = status_json("0x0400");
    worker->poll_once();
    EXPECT_FALSE(token.is_cancelled());
    reply = status_json("0x0000");
    worker->poll_once();
    EXPECT_TRUE(token.is_cancelled());
}

// Background loop reconnects after the link drops
TEST_F(StatusWorkerTest, LoopReconnectsAndWaitsForFresh) {
    worker->start();
    EXPECT_TRUE(worker->wait_for_first(std::chrono::milliseconds(2000)));
    EXPECT_TRUE(worker->wait_for_fresh(2, std::chrono::milliseconds(2000)));

    state->drop();
    const int opens_before = state->open_count();
    uint64_t seq = worker->sequence();
    EXPECT_TRUE(worker->wait_for_fresh(3, std::chrono::milliseconds(3000)));
    EXPECT_GT(worker->sequence(), seq);
    EXPECT_GT(state->open_count(), opens_before);
    worker->stop();
}

TEST_F(StatusWorkerTest, WaitForFreshTimesOutWithoutLoop) {
    EXPECT_FALSE(worker->wait_for_fresh(1, std::chrono::milliseconds(120)));
    EXPECT_FALSE(worker->wait_for_first(std::chrono::milliseconds(120)));
}
