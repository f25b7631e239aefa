#include "bookdrop/core/Config.hpp"
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace bookdrop {
namespace core {

AppConfig parseConfig(const nlohmann::json& j)
{
    AppConfig config;
    if (!j.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    if (j.contains("server")) {
        const nlohmann::json& s = j["server"];
        if (s.contains("port")) {
            auto port = s["port"].get<int>();
            if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
                throw std::runtime_error("Invalid port: " + std::to_string(port));
            }
            config.server.port = static_cast<uint16_t>(port);
        }
        if (s.contains("interface")) {
            config.server.interfaceName = s["interface"].get<std::string>();
        }
        if (s.contains("max_chunk_size")) {
            auto size = s["max_chunk_size"].get<std::size_t>();
            if (size == 0) {
                throw std::runtime_error("max_chunk_size must be positive");
            }
            config.server.maxChunkSize = size;
        }
        if (s.contains("clear_delay_ms")) {
            config.server.clearDelay = std::chrono::milliseconds(s["clear_delay_ms"].get<long>());
        }
    }

    if (j.contains("library")) {
        const nlohmann::json& l = j["library"];
        if (l.contains("path")) {
            config.library.path = l["path"].get<std::string>();
        }
    }

    return config;
}

AppConfig loadConfig(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path);
    }

    try {
        nlohmann::json j;
        file >> j;
        return parseConfig(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Configuration error in " << path << ": " << e.what() << std::endl;
        throw std::runtime_error(std::string("Invalid configuration: ") + e.what());
    }
}

} // namespace core
} // namespace bookdrop
