#pragma once

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "types.h"

namespace Error {
inline void print_usage() {
    std::cerr << "usage:\n"
              << "    dropline serve [--config file] [--host h] [--port p] [--dir d] [--once] [--quiet|--verbose]\n"
              << "    dropline send [filepath...] [--config file] [--host h] [--port p] [--buffer n]\n";
}

inline void invalid_file_path() {
    std::cerr << "Invalid filepath!\n";
    print_usage();
}

inline void invalid_option(const std::string& option) {
    std::cerr << "Invalid option: " << option << "\n";
    print_usage();
}
}  // namespace Error

// Base of every failure that ends a transfer. Carries where it stopped and how
// far it got so the caller can decide whether to start over.
class TransferError : public std::runtime_error {
   public:
    TransferError(ErrorKind kind, TransferPhase phase, const std::string& what, std::uint64_t bytes = 0)
        : std::runtime_error(what), m_kind(kind), m_phase(phase), m_bytes(bytes) {}

    ErrorKind kind() const { return m_kind; }
    TransferPhase phase() const { return m_phase; }
    std::uint64_t bytes_transferred() const { return m_bytes; }

   private:
    ErrorKind m_kind;
    TransferPhase m_phase;
    std::uint64_t m_bytes;
};

class FileNotFoundError : public TransferError {
   public:
    explicit FileNotFoundError(const std::string& what)
        : TransferError(ErrorKind::FileNotFound, TransferPhase::Preflight, what) {}
};

class PermissionError : public TransferError {
   public:
    explicit PermissionError(const std::string& what)
        : TransferError(ErrorKind::Permission, TransferPhase::Preflight, what) {}
};

class NetworkError : public TransferError {
   public:
    explicit NetworkError(const std::string& what) : TransferError(ErrorKind::Network, TransferPhase::Connect, what) {}
};

class ProtocolError : public TransferError {
   public:
    explicit ProtocolError(const std::string& what)
        : TransferError(ErrorKind::Protocol, TransferPhase::Metadata, what) {}
};

class ConnectionError : public TransferError {
   public:
    ConnectionError(const std::string& what, TransferPhase phase, std::uint64_t bytes)
        : TransferError(ErrorKind::Connection, phase, what, bytes) {}
};

class IncompleteTransferError : public TransferError {
   public:
    IncompleteTransferError(const std::string& what, std::uint64_t bytes)
        : TransferError(ErrorKind::IncompleteTransfer, TransferPhase::Payload, what, bytes) {}
};

class IOError : public TransferError {
   public:
    IOError(const std::string& what, std::uint64_t bytes)
        : TransferError(ErrorKind::IO, TransferPhase::Payload, what, bytes) {}
};
