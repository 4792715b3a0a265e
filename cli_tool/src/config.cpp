#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

Config Config::from_json(const json& data) {
    Config c;
    try {
        if (data.contains("host")) c.host = data["host"].get<std::string>();
        if (data.contains("port")) {
            const auto port = data["port"].get<int>();
            if (port < 0 || port > std::numeric_limits<std::uint16_t>::max()) {
                throw std::invalid_argument("port out of range: " + std::to_string(port));
            }
            c.port = static_cast<std::uint16_t>(port);
        }
        if (data.contains("buffer_size")) c.buffer_size = data["buffer_size"].get<std::size_t>();
        if (data.contains("storage_dir")) c.storage_dir = data["storage_dir"].get<std::string>();
        if (data.contains("acknowledge")) c.acknowledge = data["acknowledge"].get<bool>();
        if (data.contains("backlog")) c.backlog = data["backlog"].get<int>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("[CONFIG] ") + e.what());
    }
    return c;
}

Config load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("[CONFIG] Error opening file: " + path.string());
    }
    json data;
    try {
        file >> data;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("[CONFIG] " + path.string() + ": " + e.what());
    }
    if (!data.is_object()) {
        throw std::runtime_error("[CONFIG] " + path.string() + ": expected a JSON object");
    }
    return Config::from_json(data);
}

std::uint16_t parse_port(const std::string& text) {
    std::size_t used = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid port: " + text);
    }
    if (used != text.size() || value > std::numeric_limits<std::uint16_t>::max()) {
        throw std::invalid_argument("invalid port: " + text);
    }
    return static_cast<std::uint16_t>(value);
}

std::size_t parse_buffer_size(const std::string& text) {
    std::size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid buffer size: " + text);
    }
    if (used != text.size()) {
        throw std::invalid_argument("invalid buffer size: " + text);
    }
    return static_cast<std::size_t>(value);
}

void apply_env(Config& config) {
    if (const char* host = std::getenv("DROPLINE_HOST")) config.host = host;
    if (const char* port = std::getenv("DROPLINE_PORT")) config.port = parse_port(port);
    if (const char* size = std::getenv("DROPLINE_BUFFER_SIZE")) config.buffer_size = parse_buffer_size(size);
    if (const char* dir = std::getenv("DROPLINE_STORAGE_DIR")) config.storage_dir = dir;
}

void validate(const Config& config) {
    if (config.host.empty()) {
        throw std::invalid_argument("host must not be empty");
    }
    if (config.buffer_size == 0 || config.buffer_size > Config::MaxBufferSize) {
        throw std::invalid_argument("buffer_size must be between 1 and " + std::to_string(Config::MaxBufferSize));
    }
    if (config.storage_dir.empty()) {
        throw std::invalid_argument("storage_dir must not be empty");
    }
    if (config.backlog < 1) {
        throw std::invalid_argument("backlog must be at least 1");
    }
}
