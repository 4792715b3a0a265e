#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// Settings shared by the listener, connector and both transfer roles.
struct Config {
    std::string host = "127.0.0.1";
    std::uint16_t port = 5001;
    std::size_t buffer_size = 1024;
    std::filesystem::path storage_dir = ".";
    bool acknowledge = true;
    int backlog = 1;

    static constexpr std::size_t MaxBufferSize = 1024 * 1024;

    static Config from_json(const json& data);
};

// Reads a JSON config file. Keys that are absent keep their defaults.
Config load_config(const std::filesystem::path& path);

// DROPLINE_HOST, DROPLINE_PORT, DROPLINE_BUFFER_SIZE, DROPLINE_STORAGE_DIR
void apply_env(Config& config);

// Throws std::invalid_argument describing the first bad field.
void validate(const Config& config);

std::uint16_t parse_port(const std::string& text);
std::size_t parse_buffer_size(const std::string& text);
