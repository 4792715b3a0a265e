#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

/*
two commands:
./dropline serve            receive files into the storage dir
./dropline send <file...>   push files to a running receiver
*/

namespace Command {
inline constexpr std::string_view SERVE = "serve";
inline constexpr std::string_view SEND = "send";
}  // namespace Command

namespace Wire {
// [u16 name length][name bytes][u64 size], both big-endian
inline constexpr std::size_t NameLengthBytes = 2;
inline constexpr std::size_t SizeBytes = 8;
inline constexpr std::size_t MaxNameLength = 0xFFFF;

// optional status byte, receiver -> sender, after the payload
inline constexpr std::uint8_t AckSuccess = 0x00;
inline constexpr std::uint8_t AckFailed = 0x01;
}  // namespace Wire

struct TransferMetadata {
    std::string name;
    std::uint64_t size = 0;
};

inline bool operator==(const TransferMetadata& a, const TransferMetadata& b) {
    return a.name == b.name && a.size == b.size;
}

enum class TransferPhase { Preflight, Connect, Metadata, Payload, Acknowledge, Done };

enum class ErrorKind { None, FileNotFound, Permission, Network, Protocol, Connection, IncompleteTransfer, IO };

inline std::string_view to_string(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Preflight:
            return "pre-flight validation";
        case TransferPhase::Connect:
            return "connection setup";
        case TransferPhase::Metadata:
            return "metadata exchange";
        case TransferPhase::Payload:
            return "payload transfer";
        case TransferPhase::Acknowledge:
            return "acknowledgement";
        case TransferPhase::Done:
            return "done";
    }
    return "unknown";
}

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::FileNotFound:
            return "FileNotFoundError";
        case ErrorKind::Permission:
            return "PermissionError";
        case ErrorKind::Network:
            return "NetworkError";
        case ErrorKind::Protocol:
            return "ProtocolError";
        case ErrorKind::Connection:
            return "ConnectionError";
        case ErrorKind::IncompleteTransfer:
            return "IncompleteTransferError";
        case ErrorKind::IO:
            return "IOError";
    }
    return "unknown";
}

// Outcome of one transfer as seen by the role that ran it.
struct TransferResult {
    bool ok = false;
    TransferMetadata metadata;
    std::filesystem::path path;  // source on the sender, saved file on the receiver
    std::uint64_t bytes_transferred = 0;
    TransferPhase phase = TransferPhase::Preflight;
    ErrorKind error = ErrorKind::None;
    std::string message;
    std::string sha256;
    bool acknowledged = false;
};
