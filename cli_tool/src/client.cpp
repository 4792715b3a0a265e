#include "client.hpp"

#include <fstream>
#include <system_error>

#include "crypto.hpp"
#include "error.hpp"
#include "log.hpp"
#include "session.hpp"

namespace fs = std::filesystem;

void Sender::preflight(const fs::path& path) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        throw FileNotFoundError("File not found: " + path.string());
    }
    if (!fs::is_regular_file(status)) {
        throw FileNotFoundError("Not a regular file: " + path.string());
    }
    std::ifstream file(path, std::ifstream::binary);
    if (!file.is_open()) {
        throw PermissionError("Permission denied to read file: " + path.string());
    }
}

TransferResult Sender::send(tcp::socket socket, const fs::path& path, const ProgressCallback& progress) const {
    SendSession session(std::move(socket), m_config, progress);
    TransferResult result;
    try {
        preflight(path);
        result = session.run(path);
    } catch (const TransferError& e) {
        result.ok = false;
        result.error = e.kind();
        result.phase = e.phase();
        result.message = e.what();
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = ErrorKind::IO;
        result.phase = session.state() == State::Metadata ? TransferPhase::Metadata : TransferPhase::Payload;
        result.message = e.what();
    }

    if (!result.ok) {
        result.path = path;
        result.metadata = session.metadata();
        result.bytes_transferred = session.bytes_transferred();
        Log::error(std::string(to_string(result.error)) + " during " + std::string(to_string(result.phase)) + " after " +
                   std::to_string(result.bytes_transferred) + " bytes: " + result.message);
        return result;
    }

    try {
        result.sha256 = Crypto::compute_file_hash(path);
    } catch (const std::runtime_error& e) {
        Log::warn(e.what());
    }
    Log::ok("File '" + result.metadata.name + "' sent successfully!");
    if (!result.acknowledged) Log::info("Receiver closed without confirming.");
    if (!result.sha256.empty()) Log::info("SHA-256: " + result.sha256);
    return result;
}

tcp::socket connect_to(asio::io_context& io, const std::string& host, uint16_t port) {
    if (port == 0) {
        throw NetworkError("cannot connect to port 0");
    }
    Log::info("Connecting to " + host + ":" + std::to_string(port) + "...");
    asio::error_code ec;
    tcp::resolver resolver(io);
    const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw NetworkError("cannot resolve " + host + ": " + ec.message());
    }
    tcp::socket socket(io);
    asio::connect(socket, endpoints, ec);
    if (ec) {
        throw NetworkError("Could not connect to " + host + ":" + std::to_string(port) + ": " + ec.message());
    }
    Log::ok("Connected to receiver!");
    return socket;
}

TransferResult send_file(const fs::path& path, const Config& config, const ProgressCallback& progress) {
    TransferResult result;
    result.path = path;
    try {
        Sender::preflight(path);
    } catch (const TransferError& e) {
        result.error = e.kind();
        result.phase = e.phase();
        result.message = e.what();
        Log::error(result.message);
        return result;
    }

    asio::io_context io;
    tcp::socket socket(io);
    try {
        socket = connect_to(io, config.host, config.port);
    } catch (const NetworkError& e) {
        result.error = e.kind();
        result.phase = e.phase();
        result.message = e.what();
        Log::error(result.message);
        return result;
    }
    return Sender(config).send(std::move(socket), path, progress);
}
