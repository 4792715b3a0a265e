#include "session.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include "error.hpp"
#include "framing.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {
// Short fixed-length name so any destination name that fits the directory
// can be staged. mkstemp opens with O_EXCL, so nothing existing is touched.
std::filesystem::path create_staging_file(const std::filesystem::path& dir) {
    std::string templ = (dir / ".dropline-XXXXXX").string();
    const int fd = ::mkstemp(&templ[0]);
    if (fd < 0) {
        throw IOError("cannot create staging file in " + dir.string() + ": " + std::strerror(errno), 0);
    }
    ::close(fd);
    return templ;
}
}  // namespace

SendSession::SendSession(tcp::socket socket, const Config& config, ProgressCallback progress)
    : m_socket(std::move(socket)), m_config(config), m_progress(std::move(progress)), m_chunk(config.buffer_size) {}

SendSession::~SendSession() { close_connection(); }

void SendSession::close_connection() {
    m_state = State::Closed;
    if (!m_socket.is_open()) return;
    asio::error_code ec;
    m_socket.shutdown(tcp::socket::shutdown_both, ec);
    m_socket.close(ec);
}

void SendSession::report_progress() const {
    if (m_progress) m_progress(m_bytes, m_metadata.size);
}

TransferResult SendSession::run(const std::filesystem::path& path) {
    std::error_code fs_ec;
    const auto size = std::filesystem::file_size(path, fs_ec);
    if (fs_ec) {
        throw FileNotFoundError("cannot stat " + path.string() + ": " + fs_ec.message());
    }
    m_file.open(path, std::ifstream::binary);
    if (!m_file.is_open()) {
        throw PermissionError("cannot open " + path.string() + " for reading");
    }
    m_metadata.name = path.filename().string();
    m_metadata.size = size;

    m_state = State::Metadata;
    Log::info("Sending " + m_metadata.name + " (" + Utils::human_size(size) + ")");
    Framing::write_metadata(m_socket, m_metadata);

    m_state = State::Transferring;
    send_payload();

    TransferResult result;
    result.metadata = m_metadata;
    result.path = path;
    result.bytes_transferred = m_bytes;
    result.acknowledged = await_ack();
    result.phase = TransferPhase::Done;
    result.ok = true;
    close_connection();
    return result;
}

void SendSession::send_payload() {
    if (m_metadata.size == 0) {
        report_progress();
        return;
    }
    while (m_bytes < m_metadata.size) {
        const auto want =
            static_cast<std::streamsize>(std::min<std::uint64_t>(m_chunk.size(), m_metadata.size - m_bytes));
        m_file.read(m_chunk.data(), want);
        const std::streamsize n = m_file.gcount();
        if (n <= 0) {
            if (m_file.bad()) {
                throw IOError("read error on " + m_metadata.name, m_bytes);
            }
            throw IOError(m_metadata.name + " shrank during transfer at " + std::to_string(m_bytes) + " bytes",
                          m_bytes);
        }

        asio::error_code ec;
        asio::write(m_socket, asio::buffer(m_chunk.data(), static_cast<std::size_t>(n)), ec);
        if (ec) {
            throw ConnectionError("write failed after " + std::to_string(m_bytes) + " bytes: " + ec.message(),
                                  TransferPhase::Payload, m_bytes);
        }
        m_bytes += static_cast<std::uint64_t>(n);
        report_progress();
    }
}

// A clean close without a status byte counts as completion; only an explicit
// failure byte or a socket error fails the transfer.
bool SendSession::await_ack() {
    if (!m_config.acknowledge) return false;
    std::uint8_t status = 0;
    asio::error_code ec;
    asio::read(m_socket, asio::buffer(&status, 1), ec);
    if (ec == asio::error::eof) {
        Log::debug("receiver closed without acknowledgement");
        return false;
    }
    if (ec) {
        throw ConnectionError("no acknowledgement from receiver: " + ec.message(), TransferPhase::Acknowledge,
                              m_bytes);
    }
    if (status != Wire::AckSuccess) {
        throw ConnectionError("receiver reported failure", TransferPhase::Acknowledge, m_bytes);
    }
    return true;
}

ReceiveSession::ReceiveSession(tcp::socket socket, const Config& config, ProgressCallback progress)
    : m_socket(std::move(socket)), m_config(config), m_progress(std::move(progress)), m_chunk(config.buffer_size) {}

ReceiveSession::~ReceiveSession() { close_connection(); }

void ReceiveSession::close_connection() {
    m_state = State::Closed;
    if (m_file.is_open()) m_file.close();
    if (!m_socket.is_open()) return;
    asio::error_code ec;
    m_socket.shutdown(tcp::socket::shutdown_both, ec);
    m_socket.close(ec);
}

void ReceiveSession::report_progress() const {
    if (m_progress) m_progress(m_bytes, m_metadata.size);
}

bool ReceiveSession::send_status(std::uint8_t status) {
    if (!m_config.acknowledge) return false;
    asio::error_code ec;
    asio::write(m_socket, asio::buffer(&status, 1), ec);
    if (ec) {
        Log::warn("could not deliver status to sender: " + ec.message());
        return false;
    }
    return true;
}

TransferResult ReceiveSession::run() {
    m_state = State::Metadata;
    m_metadata = Framing::read_metadata(m_socket);
    Log::info("Receiving file: " + m_metadata.name + " (" + std::to_string(m_metadata.size) + " bytes)");

    try {
        m_destination = Utils::resolve_destination(m_config.storage_dir, m_metadata.name);
    } catch (const ProtocolError&) {
        send_status(Wire::AckFailed);
        throw;
    }
    try {
        m_partial = create_staging_file(m_destination.parent_path());
    } catch (const IOError&) {
        send_status(Wire::AckFailed);
        throw;
    }

    m_file.open(m_partial, std::ios::binary | std::ios::trunc);
    if (!m_file.is_open()) {
        send_status(Wire::AckFailed);
        throw IOError("cannot create " + m_partial.string(), 0);
    }

    m_state = State::Transferring;
    receive_payload();

    m_file.flush();
    m_file.close();
    if (m_file.fail()) {
        send_status(Wire::AckFailed);
        throw IOError("failed to flush " + m_partial.string(), m_bytes);
    }

    std::error_code fs_ec;
    std::filesystem::rename(m_partial, m_destination, fs_ec);
    if (fs_ec) {
        send_status(Wire::AckFailed);
        throw IOError("cannot move " + m_partial.string() + " into place: " + fs_ec.message(), m_bytes);
    }

    const bool acknowledged = send_status(Wire::AckSuccess);
    close_connection();

    TransferResult result;
    result.ok = true;
    result.metadata = m_metadata;
    result.path = m_destination;
    result.bytes_transferred = m_bytes;
    result.phase = TransferPhase::Done;
    result.acknowledged = acknowledged;
    return result;
}

// Stops at exactly metadata.size bytes; anything the peer sends after that is
// left on the socket.
void ReceiveSession::receive_payload() {
    if (m_metadata.size == 0) {
        report_progress();
        return;
    }
    while (m_bytes < m_metadata.size) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(m_chunk.size(), m_metadata.size - m_bytes));
        asio::error_code ec;
        const std::size_t n = m_socket.read_some(asio::buffer(m_chunk.data(), want), ec);
        if (ec) {
            throw IncompleteTransferError("connection closed after " + std::to_string(m_bytes) + " of " +
                                              std::to_string(m_metadata.size) + " bytes: " + ec.message(),
                                          m_bytes);
        }

        m_file.write(m_chunk.data(), static_cast<std::streamsize>(n));
        if (!m_file) {
            send_status(Wire::AckFailed);
            throw IOError("write error on " + m_partial.string(), m_bytes);
        }
        m_bytes += n;
        report_progress();
    }
}
