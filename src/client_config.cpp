#include "client_config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace robot {

using json = nlohmann::json;

namespace {

template <typename T>
void read_field(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null())
        out = it->get<T>();
}

bool read_json_file(const std::string& path, json& out) {
    std::ifstream file(path);
    if (!file.is_open())
        return false;
    try {
        file >> out;
    } catch (const std::exception& e) {
        std::cerr << "[Config] JSON parse error in " << path << ": " << e.what() << "\n";
        return false;
    }
    return out.is_object();
}

std::string settings_path_from_env() {
    const char* env_path = std::getenv("AIMLINK_SETTINGS");
    return (env_path && *env_path) ? env_path : "settings.json";
}

} // namespace

bool ClientConfig::validate() const noexcept {
    if (scheme != "ws" && scheme != "wss") return false;
    if (connect_timeout_ms <= 0) return false;
    if (reconnect_interval_ms < 0) return false;
    if (status_period_ms <= 0 || idle_period_ms <= 0 || image_idle_period_ms <= 0) return false;
    if (status_loss_limit < 0) return false;
    if (image_wait_ms < 0) return false;
    if (block_timeout_ms <= 0 || block_poll_ms <= 0 || block_debounce_ms < 0) return false;
    if (first_status_timeout_ms < 0) return false;
    if (shadow_hold_snapshots < 1) return false;
    return true;
}

bool ClientConfig::load_from_file(const std::string& path) {
    json j;
    if (!read_json_file(path, j)) {
        std::cerr << "[Config] Failed to open: " << path << "\n";
        return false;
    }

    try {
        if (j.contains("connection") && j["connection"].is_object()) {
            const json& conn = j["connection"];
            read_field(conn, "host", host);
            read_field(conn, "scheme", scheme);
            read_field(conn, "channel_prefix", channel_prefix);
        }
        if (j.contains("client") && j["client"].is_object()) {
            const json& c = j["client"];
            read_field(c, "connect_timeout_ms", connect_timeout_ms);
            read_field(c, "reconnect_interval_ms", reconnect_interval_ms);
            read_field(c, "status_period_ms", status_period_ms);
            read_field(c, "status_loss_limit", status_loss_limit);
            read_field(c, "idle_period_ms", idle_period_ms);
            read_field(c, "image_idle_period_ms", image_idle_period_ms);
            read_field(c, "image_wait_ms", image_wait_ms);
            read_field(c, "block_timeout_ms", block_timeout_ms);
            read_field(c, "block_poll_ms", block_poll_ms);
            read_field(c, "block_debounce_ms", block_debounce_ms);
            read_field(c, "first_status_timeout_ms", first_status_timeout_ms);
            read_field(c, "shadow_hold_snapshots", shadow_hold_snapshots);
            read_field(c, "throw_on_rejected", throw_on_rejected);
            read_field(c, "verbose", verbose);
        }
    } catch (const json::exception& e) {
        std::cerr << "[Config] Bad value in " << path << ": " << e.what() << "\n";
        return false;
    }

    return validate();
}

std::string ClientConfig::uri_for(const std::string& resolved_host, const std::string& channel) const {
    return scheme + "://" + resolved_host + "/" + channel_prefix + channel;
}

Settings::Settings() : Settings(settings_path_from_env()) {}

Settings::Settings(const std::string& path) : path_(path) {
    json j;
    if (!read_json_file(path_, j))
        return;
    loaded_ = true;
    if (auto conn = j.find("connection"); conn != j.end() && conn->is_object()) {
        if (auto h = conn->find("host"); h != conn->end() && h->is_string())
            host_ = h->get<std::string>();
    }
}

std::string Settings::default_host() const {
    if (const char* env_host = std::getenv("AIMLINK_HOST"); env_host && *env_host)
        return env_host;
    if (!host_.empty())
        return host_;
    return "localhost";
}

} // namespace robot
