#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace bookdrop {
namespace core {

struct ServerConfig {
    uint16_t port = 8080;                       // 0 binds an ephemeral port
    std::string interfaceName = "wlan0";        // empty: first up, non-loopback IPv4 interface
    std::size_t maxChunkSize = 64 * 1024;       // bytes per receive
    std::chrono::milliseconds clearDelay{2000}; // grace period before clearing upload progress
};

struct LibraryConfig {
    std::string path = "library";
};

struct AppConfig {
    ServerConfig server;
    LibraryConfig library;
};

// Build a configuration from JSON; missing keys keep their defaults
AppConfig parseConfig(const nlohmann::json& j);

// Load and parse a JSON configuration file. Throws std::runtime_error.
AppConfig loadConfig(const std::string& path);

} // namespace core
} // namespace bookdrop
