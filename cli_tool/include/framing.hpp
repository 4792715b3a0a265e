// Metadata frame that precedes the payload on every connection:
//   [u16 BE name length][name bytes, UTF-8][u64 BE size]
// The payload follows as exactly `size` raw bytes with no further framing.
#pragma once

#include <asio.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "types.h"

using asio::ip::tcp;

namespace Framing {
void write_u16_be(std::uint8_t out[2], std::uint16_t v);
std::uint16_t read_u16_be(const std::uint8_t in[2]);
void write_u64_be(std::uint8_t out[8], std::uint64_t v);
std::uint64_t read_u64_be(const std::uint8_t in[8]);

// Throws ProtocolError if the name is empty or longer than Wire::MaxNameLength.
std::vector<std::uint8_t> encode_metadata(const std::string& name, std::uint64_t size);

// Decodes one complete frame held in memory. Truncated input and trailing
// bytes are both ProtocolError.
TransferMetadata decode_metadata(const std::uint8_t* data, std::size_t n);

inline TransferMetadata decode_metadata(const std::vector<std::uint8_t>& frame) {
    return decode_metadata(frame.data(), frame.size());
}

// Blocks until the whole frame has been read. ProtocolError if the peer goes
// away first or the frame carries an empty name.
TransferMetadata read_metadata(tcp::socket& socket);

// ConnectionError (phase Metadata) if the socket fails.
void write_metadata(tcp::socket& socket, const TransferMetadata& metadata);
}  // namespace Framing
