#include <gtest/gtest.h>
#include "client_config.hpp"
#include <cstdlib>
#include <fstream>
#include <string>

using namespace robot;

namespace {

std::string write_settings(const std::string& name, const std::string& text)
{
    std::string path = ::testing::TempDir() + name;
    std::ofstream f(path);
    f << text;
    return path;
}

class EnvGuard {
public:
    explicit EnvGuard(const char* name) : name_(name) {
        const char* v = std::getenv(name);
        if (v) {
            had_ = true;
            old_ = v;
        }
    }
    ~EnvGuard() {
        if (had_)
            setenv(name_, old_.c_str(), 1);
        else
            unsetenv(name_);
    }

private:
    const char* name_;
    bool had_ = false;
    std::string old_;
};

} // namespace

TEST(ClientConfigTest, DefaultsAreValid) {
    ClientConfig cfg;
    EXPECT_TRUE(cfg.validate());
    EXPECT_EQ(cfg.status_period_ms, 50);
    EXPECT_EQ(cfg.status_loss_limit, 5);
    EXPECT_EQ(cfg.image_wait_ms, 500);
    EXPECT_EQ(cfg.block_timeout_ms, 10000);
    EXPECT_FALSE(cfg.throw_on_rejected);
}

TEST(ClientConfigTest, UriForChannel) {
    ClientConfig cfg;
    EXPECT_EQ(cfg.uri_for("192.168.4.1", channels::kStatus), "ws://192.168.4.1/ws_status");
    cfg.scheme = "wss";
    cfg.channel_prefix = "";
    EXPECT_EQ(cfg.uri_for("robot", channels::kImage), "wss://robot/img");
}

TEST(ClientConfigTest, ValidateRejectsBadValues) {
    ClientConfig cfg;
    cfg.scheme = "http";
    EXPECT_FALSE(cfg.validate());
    cfg = ClientConfig();
    cfg.status_period_ms = 0;
    EXPECT_FALSE(cfg.validate());
    cfg = ClientConfig();
    cfg.shadow_hold_snapshots = 0;
    EXPECT_FALSE(cfg.validate());
}

TEST(ClientConfigTest, LoadFromFile) {
    std::string path = write_settings("aimlink_cfg.json", R"({
        "connection": {"host": "10.0.0.7", "channel_prefix": "ws_"},
        "client": {"status_period_ms": 20, "throw_on_rejected": true, "shadow_hold_snapshots": 4}
    })");
    ClientConfig cfg;
    ASSERT_TRUE(cfg.load_from_file(path));
    EXPECT_EQ(cfg.host, "10.0.0.7");
    EXPECT_EQ(cfg.status_period_ms, 20);
    EXPECT_TRUE(cfg.throw_on_rejected);
    EXPECT_EQ(cfg.shadow_hold_snapshots, 4);
    EXPECT_EQ(cfg.block_poll_ms, 100);
}

TEST(ClientConfigTest, LoadFailures) {
    ClientConfig cfg;
    EXPECT_FALSE(cfg.load_from_file(::testing::TempDir() + "missing_aimlink.json"));
    EXPECT_FALSE(cfg.load_from_file(write_settings("aimlink_bad.json", "{ nope")));
    EXPECT_FALSE(cfg.load_from_file(write_settings("aimlink_type.json", R"({"client": {"status_period_ms": "fast"}})")));
    EXPECT_FALSE(cfg.load_from_file(write_settings("aimlink_range.json", R"({"client": {"block_poll_ms": -1}})")));
}

TEST(SettingsTest, HostFromFile) {
    EnvGuard guard("AIMLINK_HOST");
    unsetenv("AIMLINK_HOST");
    Settings s(write_settings("aimlink_settings.json", R"({"connection": {"host": "robot.local"}})"));
    EXPECT_TRUE(s.loaded());
    EXPECT_EQ(s.default_host(), "robot.local");
}

TEST(SettingsTest, EnvironmentOverridesFile) {
    EnvGuard guard("AIMLINK_HOST");
    setenv("AIMLINK_HOST", "192.168.4.1", 1);
    Settings s(write_settings("aimlink_settings2.json", R"({"connection": {"host": "robot.local"}})"));
    EXPECT_EQ(s.default_host(), "192.168.4.1");
}

TEST(SettingsTest, FallsBackToLocalhost) {
    EnvGuard guard("AIMLINK_HOST");
    unsetenv("AIMLINK_HOST");
    Settings s(::testing::TempDir() + "no_settings_here.json");
    EXPECT_FALSE(s.loaded());
    EXPECT_EQ(s.default_host(), "localhost");
}

TEST(SettingsTest, PathFromEnvironment) {
    EnvGuard guard("AIMLINK_SETTINGS");
    std::string path = write_settings("aimlink_env_settings.json", R"({"connection": {"host": "h"}})");
    setenv("AIMLINK_SETTINGS", path.c_str(), 1);
    Settings s;
    EXPECT_EQ(s.path(), path);
    EXPECT_TRUE(s.loaded());
}
