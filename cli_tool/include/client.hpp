// Sending side: open a connection to a receiver and push one file through it.
#pragma once

#include <asio.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

#include "config.hpp"
#include "progress.hpp"
#include "types.h"

using asio::ip::tcp;

class Sender {
   public:
    explicit Sender(const Config& config) : m_config(config) {}

    // FileNotFoundError if `path` is missing or not a regular file,
    // PermissionError if it cannot be opened for reading.
    static void preflight(const std::filesystem::path& path);

    // Sends `path` over `socket` and closes it. Failures come back in the
    // result rather than as exceptions.
    TransferResult send(tcp::socket socket, const std::filesystem::path& path,
                        const ProgressCallback& progress = {}) const;

   private:
    Config m_config;
};

// Resolves and connects. Throws NetworkError on failure.
tcp::socket connect_to(asio::io_context& io, const std::string& host, uint16_t port);

// Pre-flight checks, connect to config.host:config.port, then send. Never
// throws for transfer failures.
TransferResult send_file(const std::filesystem::path& path, const Config& config,
                         const ProgressCallback& progress = {});
