#pragma once

#include <asio.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "config.hpp"
#include "progress.hpp"
#include "types.h"

using asio::ip::tcp;

enum class State { Metadata, Transferring, Closed };

// Per-connection state for the sending side. Owns the socket and the source
// file; both are released when the session is destroyed.
class SendSession {
   public:
    SendSession(tcp::socket socket, const Config& config, ProgressCallback progress = {});
    ~SendSession();

    SendSession(const SendSession&) = delete;
    SendSession& operator=(const SendSession&) = delete;

    // Sends metadata then the payload of `path`. Throws a TransferError
    // subclass on failure; the connection is closed either way.
    TransferResult run(const std::filesystem::path& path);

    std::uint64_t bytes_transferred() const { return m_bytes; }
    const TransferMetadata& metadata() const { return m_metadata; }
    State state() const { return m_state; }

   private:
    void send_payload();
    bool await_ack();
    void report_progress() const;
    void close_connection();

    tcp::socket m_socket;
    const Config& m_config;
    ProgressCallback m_progress;
    std::ifstream m_file;
    TransferMetadata m_metadata;
    std::vector<char> m_chunk;
    std::uint64_t m_bytes = 0;
    State m_state = State::Metadata;
};

// Per-connection state for the receiving side. Owns the socket and the
// destination file stream.
class ReceiveSession {
   public:
    ReceiveSession(tcp::socket socket, const Config& config, ProgressCallback progress = {});
    ~ReceiveSession();

    ReceiveSession(const ReceiveSession&) = delete;
    ReceiveSession& operator=(const ReceiveSession&) = delete;

    // Reads one metadata frame and exactly `size` payload bytes into the
    // storage directory. Throws a TransferError subclass on failure.
    TransferResult run();

    std::uint64_t bytes_transferred() const { return m_bytes; }
    const TransferMetadata& metadata() const { return m_metadata; }
    const std::filesystem::path& partial_path() const { return m_partial; }
    State state() const { return m_state; }

   private:
    void receive_payload();
    bool send_status(std::uint8_t status);
    void report_progress() const;
    void close_connection();

    tcp::socket m_socket;
    const Config& m_config;
    ProgressCallback m_progress;
    std::ofstream m_file;
    TransferMetadata m_metadata;
    std::filesystem::path m_destination;
    std::filesystem::path m_partial;
    std::vector<char> m_chunk;
    std::uint64_t m_bytes = 0;
    State m_state = State::Metadata;
};
