#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "bookdrop/core/Config.hpp"

using namespace bookdrop::core;

TEST(Config, Defaults) {
    AppConfig config = parseConfig(nlohmann::json::object());
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.interfaceName, "wlan0");
    EXPECT_EQ(config.server.maxChunkSize, 65536u);
    EXPECT_EQ(config.server.clearDelay, std::chrono::milliseconds(2000));
    EXPECT_EQ(config.library.path, "library");
}

TEST(Config, Overrides) {
    auto j = nlohmann::json::parse(R"({
        "server": {"port": 9090, "interface": "en0", "max_chunk_size": 1024, "clear_delay_ms": 500},
        "library": {"path": "/tmp/books"}
    })");
    AppConfig config = parseConfig(j);
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.interfaceName, "en0");
    EXPECT_EQ(config.server.maxChunkSize, 1024u);
    EXPECT_EQ(config.server.clearDelay, std::chrono::milliseconds(500));
    EXPECT_EQ(config.library.path, "/tmp/books");
}

TEST(Config, RejectsInvalidValues) {
    EXPECT_THROW(parseConfig(nlohmann::json::parse(R"({"server": {"port": 70000}})")), std::runtime_error);
    EXPECT_THROW(parseConfig(nlohmann::json::parse(R"({"server": {"max_chunk_size": 0}})")), std::runtime_error);
    EXPECT_THROW(parseConfig(nlohmann::json::array()), std::runtime_error);
}

TEST(Config, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "bookdrop_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"server": {"port": 0}})";
    }
    AppConfig config = loadConfig(path.string());
    EXPECT_EQ(config.server.port, 0);
    EXPECT_EQ(config.server.interfaceName, "wlan0");
    std::filesystem::remove(path);

    EXPECT_THROW(loadConfig(path.string()), std::runtime_error);

    {
        std::ofstream file(path);
        file << "{broken";
    }
    EXPECT_THROW(loadConfig(path.string()), std::runtime_error);
    std::filesystem::remove(path);
}
