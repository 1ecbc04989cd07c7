#include <gtest/gtest.h>
#include "audio_worker.hpp"
#include "errors.hpp"
#include "fake_connection.hpp"
#include <cstdio>
#include <fstream>
#include <string>

using namespace robot;

namespace {

uint32_t le32(const std::string& buf, size_t off)
{
    return static_cast<uint32_t>(static_cast<unsigned char>(buf[off])) |
           (static_cast<uint32_t>(static_cast<unsigned char>(buf[off + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<unsigned char>(buf[off + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<unsigned char>(buf[off + 3])) << 24);
}

std::string wav_bytes(uint16_t channels)
{
    std::string d(44, '\0');
    d.replace(0, 4, "RIFF");
    d.replace(8, 4, "WAVE");
    d.replace(12, 4, "fmt ");
    d[22] = static_cast<char>(channels & 0xFF);
    d[23] = static_cast<char>(channels >> 8);
    return d + std::string(100, '\x10');
}

std::string write_temp(const std::string& name, const std::string& data)
{
    std::string path = ::testing::TempDir() + name;
    std::ofstream f(path, std::ios::binary);
    f << data;
    return path;
}

} // namespace

TEST(AudioPayloadTest, HeaderLayout) {
    std::string data(300, 'a');
    std::string p = build_audio_payload(AudioFormat::Mp3, data, 150, "chime.mp3", 2);
    ASSERT_EQ(p.size(), 64u + 300u);
    EXPECT_EQ(p[0], 1);
    EXPECT_EQ(p[1], 100); // volume clamped
    EXPECT_EQ(le32(p, 4), 300u);
    EXPECT_EQ(le32(p, 8), 2u);
    EXPECT_EQ(p.substr(32, 9), "chime.mp3");
    EXPECT_EQ(p[41], '\0');
    EXPECT_EQ(p.substr(64), data);
}

TEST(AudioPayloadTest, LongNameIsTruncated) {
    std::string p = build_audio_payload(AudioFormat::Wav, "x", -5, std::string(40, 'n'));
    EXPECT_EQ(p[1], 0);
    EXPECT_EQ(p.substr(32, 32), std::string(32, 'n'));
    EXPECT_EQ(p[64], 'x');
}

// Header counts toward the 255 KiB limit
TEST(AudioPayloadTest, TooBigIsRejected) {
    EXPECT_NO_THROW(build_audio_payload(AudioFormat::Wav, std::string(255 * 1024 - 64, 'a'), 50, "ok.wav"));
    EXPECT_THROW(build_audio_payload(AudioFormat::Wav, std::string(255 * 1024 - 63, 'a'), 50, "big.wav"),
                 InvalidSoundFile);
}

TEST(SoundFileTest, BadExtension) {
    EXPECT_THROW(load_sound_file(write_temp("tone.ogg", "abc"), 50), InvalidSoundFile);
    EXPECT_THROW(load_sound_file(write_temp("tone", "abc"), 50), InvalidSoundFile);
}

TEST(SoundFileTest, MissingFile) {
    EXPECT_THROW(load_sound_file(::testing::TempDir() + "does_not_exist.wav", 50), InvalidSoundFile);
}

TEST(SoundFileTest, WavValidation) {
    EXPECT_THROW(load_sound_file(write_temp("fake.wav", std::string(64, 'z')), 50), InvalidSoundFile);
    EXPECT_THROW(load_sound_file(write_temp("surround.wav", wav_bytes(6)), 50), InvalidSoundFile);

    std::string mono = wav_bytes(1);
    std::string p = load_sound_file(write_temp("Mono.WAV", mono), 80);
    EXPECT_EQ(p[0], 0);
    EXPECT_EQ(p[1], 80);
    EXPECT_EQ(p.substr(32, 8), "Mono.WAV");
    EXPECT_EQ(p.substr(64), mono);

    EXPECT_NO_THROW(load_sound_file(write_temp("stereo.wav", wav_bytes(2)), 50));
}

// Mp3 data is passed through unchecked
TEST(SoundFileTest, Mp3IsAccepted) {
    std::string p = load_sound_file(write_temp("beep.mp3", "ID3....."), 50);
    EXPECT_EQ(p[0], 1);
    EXPECT_EQ(le32(p, 4), 8u);
}

TEST(AudioWorkerTest, UploadIsOneBinaryMessage) {
    auto state = std::make_shared<FakeConnection::State>();
    ClientConfig cfg;
    CancellationToken token;
    AudioWorker worker("ws://robot/ws_audio", std::make_unique<FakeConnection>(state), cfg, token);
    ASSERT_TRUE(worker.connect(100));
    EXPECT_EQ(worker.name(), "ws_audio");

    std::string payload = build_audio_payload(AudioFormat::Wav, "pcm", 50, "a.wav");
    worker.send_audio(payload);
    auto sent = state->sent_copy();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].first, payload);
    EXPECT_EQ(sent[0].second, ws::Opcode::Binary);

    state->drop();
    EXPECT_THROW(worker.send_audio(payload), Disconnected);
}
