#include <gtest/gtest.h>
#include "errors.hpp"
#include "fake_connection.hpp"
#include "image_worker.hpp"
#include <chrono>
#include <memory>
#include <string>

using namespace robot;

namespace {

class ImageWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        state = std::make_shared<FakeConnection::State>();
        worker.reset(new ImageWorker("ws://robot/ws_img", std::make_unique<FakeConnection>(state), cfg, token));
        ASSERT_TRUE(worker->connect(100));
    }

    std::shared_ptr<FakeConnection::State> state;
    ClientConfig cfg;
    CancellationToken token;
    std::unique_ptr<ImageWorker> worker;
};

} // namespace

TEST_F(ImageWorkerTest, StartsWithSentinel) {
    EXPECT_TRUE(ImageWorker::is_sentinel(*worker->current_frame()));
    EXPECT_FALSE(worker->is_streaming());
}

// Nothing arrives: NoImage once the wait has elapsed
TEST_F(ImageWorkerTest, GetImageTimesOut) {
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(worker->get_image(std::chrono::milliseconds(500)), NoImage);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    EXPECT_GE(ms, 450);
    EXPECT_TRUE(worker->is_streaming());

    auto sent = state->sent_copy();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].first, std::string(1, '\x01'));
    EXPECT_EQ(sent[0].second, ws::Opcode::Binary);
}

TEST_F(ImageWorkerTest, ReceivedFrameBecomesCurrent) {
    state->push("\xFF\xD8jpeg-1");
    worker->receive_frame();
    EXPECT_EQ(*worker->current_frame(), "\xFF\xD8jpeg-1");
    state->push("\xFF\xD8jpeg-2");
    worker->receive_frame();
    EXPECT_EQ(*worker->current_frame(), "\xFF\xD8jpeg-2");
    EXPECT_EQ(worker->get_image(std::chrono::milliseconds(10)), "\xFF\xD8jpeg-2");
}

// A failed receive leaves the sentinel so callers never see a stale frame
TEST_F(ImageWorkerTest, ReceiveFailureStoresSentinel) {
    state->push("frame");
    worker->receive_frame();
    worker->receive_frame(); // inbox empty, times out
    EXPECT_TRUE(ImageWorker::is_sentinel(*worker->current_frame()));
    EXPECT_TRUE(worker->needs_reset());
}

TEST_F(ImageWorkerTest, StopStreamSendsControlByte) {
    worker->start_stream();
    worker->stop_stream();
    EXPECT_FALSE(worker->is_streaming());
    auto sent = state->sent_copy();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[1].first, std::string(1, '\0'));
}

// Loop receives frames once the stream is started
TEST_F(ImageWorkerTest, LoopDeliversStreamedFrame) {
    state->responder = [](const std::string& control) -> std::string {
        return control == std::string(1, '\x01') ? "camera-frame" : "";
    };
    state->receive_timeout_ms = 200;
    worker->start();
    EXPECT_EQ(worker->get_image(std::chrono::milliseconds(2000)), "camera-frame");
    worker->stop();
}

TEST_F(ImageWorkerTest, CancelledWhileWaiting) {
    token.request_cancel("test");
    EXPECT_THROW(worker->get_image(std::chrono::milliseconds(500)), Cancelled);
}

TEST_F(ImageWorkerTest, StartStreamWhileDisconnectedThrows) {
    state->drop();
    EXPECT_THROW(worker->start_stream(), Disconnected);
}
