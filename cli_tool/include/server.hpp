#pragma once

#include <asio.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include "config.hpp"
#include "progress.hpp"
#include "types.h"

using asio::ip::tcp;

// Receiving role. handle() runs one connection to completion and reports the
// outcome; transfer failures never escape it.
class Receiver {
   public:
    explicit Receiver(const Config& config) : m_config(config) {}

    TransferResult handle(tcp::socket socket, const ProgressCallback& progress = {}) const;

   private:
    Config m_config;
};

// Listener. Accepts one connection at a time and hands each to a Receiver
// before accepting the next.
class Server {
   public:
    using TransferHandler = std::function<void(const TransferResult&)>;

    // Binds config.host:config.port. Throws NetworkError if that fails.
    Server(asio::io_context& io_context, const Config& config);
    ~Server();

    std::uint16_t port() const { return m_port; }

    // Stop accepting after `limit` connections; 0 means never.
    void set_connection_limit(std::size_t limit) { m_limit = limit; }
    void on_transfer(TransferHandler handler) { m_handler = std::move(handler); }
    void set_progress(ProgressCallback progress) { m_progress = std::move(progress); }
    void stop();

    std::size_t connections_handled() const { return m_handled; }

   private:
    void do_accept();
    void handle_connection(tcp::socket socket);

    Config m_config;
    tcp::acceptor m_acceptor;
    Receiver m_receiver;
    TransferHandler m_handler;
    ProgressCallback m_progress;
    std::uint16_t m_port = 0;
    std::size_t m_limit = 0;
    std::size_t m_handled = 0;
};
