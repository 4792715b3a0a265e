#include "server.hpp"

#include <filesystem>
#include <system_error>

#include "crypto.hpp"
#include "error.hpp"
#include "log.hpp"
#include "session.hpp"
#include "utils.hpp"

TransferResult Receiver::handle(tcp::socket socket, const ProgressCallback& progress) const {
    ReceiveSession session(std::move(socket), m_config, progress);
    TransferResult result;
    try {
        result = session.run();
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
        result.metadata = session.metadata();
        result.bytes_transferred = session.bytes_transferred();
        Log::error(std::string(to_string(result.error)) + " during " + std::string(to_string(result.phase)) + " at byte " +
                   std::to_string(result.bytes_transferred) + ": " + result.message);
        std::error_code ec;
        if (!session.partial_path().empty() && std::filesystem::exists(session.partial_path(), ec)) {
            result.path = session.partial_path();
            Log::warn("Partial data kept in " + result.path.string());
        }
        return result;
    }

    try {
        result.sha256 = Crypto::compute_file_hash(result.path);
    } catch (const std::runtime_error& e) {
        Log::warn(e.what());
    }
    Log::ok("File '" + result.metadata.name + "' received successfully!");
    Log::ok("Saved to: " + result.path.string());
    if (!result.sha256.empty()) Log::info("SHA-256: " + result.sha256);
    return result;
}

Server::Server(asio::io_context& io_context, const Config& config)
    : m_config(config), m_acceptor(io_context), m_receiver(config) {
    std::error_code fs_ec;
    std::filesystem::create_directories(m_config.storage_dir, fs_ec);
    if (fs_ec) {
        throw std::runtime_error("[SERVER] cannot create storage directory " + m_config.storage_dir.string() + ": " +
                                 fs_ec.message());
    }

    asio::error_code ec;
    tcp::endpoint endpoint;
    const auto address = asio::ip::make_address(m_config.host, ec);
    if (!ec) {
        endpoint = tcp::endpoint(address, m_config.port);
    } else {
        tcp::resolver resolver(io_context);
        auto results = resolver.resolve(m_config.host, std::to_string(m_config.port), ec);
        if (ec || results.empty()) {
            throw NetworkError("cannot resolve " + m_config.host + ": " + ec.message());
        }
        endpoint = *results.begin();
    }

    m_acceptor.open(endpoint.protocol(), ec);
    if (!ec) m_acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) m_acceptor.bind(endpoint, ec);
    if (!ec) m_acceptor.listen(m_config.backlog, ec);
    if (ec) {
        throw NetworkError("could not bind to " + m_config.host + ":" + std::to_string(m_config.port) + ": " +
                           ec.message());
    }
    m_port = m_acceptor.local_endpoint().port();
    Log::info("Listening on " + m_config.host + ":" + std::to_string(m_port));
    do_accept();
}

Server::~Server() {
    asio::error_code ec;
    m_acceptor.close(ec);
}

void Server::stop() {
    asio::post(m_acceptor.get_executor(), [this]() {
        asio::error_code ec;
        m_acceptor.close(ec);
    });
}

void Server::do_accept() {
    Log::info("Waiting for incoming connections...");
    m_acceptor.async_accept([this](asio::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !m_acceptor.is_open()) {
            return;
        }
        if (!ec) {
            handle_connection(std::move(socket));
        } else {
            Log::error("accept failed: " + ec.message());
        }
        if (m_limit != 0 && m_handled >= m_limit) {
            asio::error_code close_ec;
            m_acceptor.close(close_ec);
            return;
        }
        do_accept();
    });
}

void Server::handle_connection(tcp::socket socket) {
    asio::error_code ec;
    const auto remote = socket.remote_endpoint(ec);
    if (!ec) {
        Log::ok("Connection established from " + remote.address().to_string() + ":" + std::to_string(remote.port()));
    }

    const TransferResult result = m_receiver.handle(std::move(socket), m_progress);
    ++m_handled;
    Log::info("Connection closed.");
    if (m_handler) m_handler(result);
}
