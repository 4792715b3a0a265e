#include "framing.hpp"

#include <algorithm>
#include <array>

#include "error.hpp"

namespace Framing {

void write_u16_be(std::uint8_t out[2], std::uint16_t v) {
    out[0] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
    out[1] = static_cast<std::uint8_t>(v & 0xFF);
}

std::uint16_t read_u16_be(const std::uint8_t in[2]) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(in[0]) << 8) | in[1]);
}

void write_u64_be(std::uint8_t out[8], std::uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<std::uint8_t>(v & 0xFF);
        v >>= 8;
    }
}

std::uint64_t read_u64_be(const std::uint8_t in[8]) {
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | in[i];
    }
    return v;
}

std::vector<std::uint8_t> encode_metadata(const std::string& name, std::uint64_t size) {
    if (name.empty()) {
        throw ProtocolError("file name must not be empty");
    }
    if (name.size() > Wire::MaxNameLength) {
        throw ProtocolError("file name too long: " + std::to_string(name.size()) + " bytes");
    }
    std::vector<std::uint8_t> frame(Wire::NameLengthBytes + name.size() + Wire::SizeBytes);
    write_u16_be(frame.data(), static_cast<std::uint16_t>(name.size()));
    std::copy(name.begin(), name.end(), frame.begin() + Wire::NameLengthBytes);
    write_u64_be(frame.data() + Wire::NameLengthBytes + name.size(), size);
    return frame;
}

TransferMetadata decode_metadata(const std::uint8_t* data, std::size_t n) {
    if (n < Wire::NameLengthBytes) {
        throw ProtocolError("metadata truncated: missing name length");
    }
    const std::size_t name_len = read_u16_be(data);
    if (name_len == 0) {
        throw ProtocolError("metadata carries an empty file name");
    }
    const std::size_t expected = Wire::NameLengthBytes + name_len + Wire::SizeBytes;
    if (n < expected) {
        throw ProtocolError("metadata truncated: expected " + std::to_string(expected) + " bytes, got " +
                            std::to_string(n));
    }
    if (n > expected) {
        throw ProtocolError("unexpected " + std::to_string(n - expected) + " bytes after metadata");
    }
    TransferMetadata meta;
    meta.name.assign(reinterpret_cast<const char*>(data + Wire::NameLengthBytes), name_len);
    meta.size = read_u64_be(data + Wire::NameLengthBytes + name_len);
    return meta;
}

TransferMetadata read_metadata(tcp::socket& socket) {
    asio::error_code ec;
    std::array<std::uint8_t, Wire::NameLengthBytes> len_buf{};
    asio::read(socket, asio::buffer(len_buf), ec);
    if (ec) {
        throw ProtocolError("metadata truncated: " + ec.message());
    }
    const std::size_t name_len = read_u16_be(len_buf.data());
    if (name_len == 0) {
        throw ProtocolError("metadata carries an empty file name");
    }

    std::vector<std::uint8_t> rest(name_len + Wire::SizeBytes);
    asio::read(socket, asio::buffer(rest), ec);
    if (ec) {
        throw ProtocolError("metadata truncated: " + ec.message());
    }

    TransferMetadata meta;
    meta.name.assign(reinterpret_cast<const char*>(rest.data()), name_len);
    meta.size = read_u64_be(rest.data() + name_len);
    return meta;
}

void write_metadata(tcp::socket& socket, const TransferMetadata& metadata) {
    const auto frame = encode_metadata(metadata.name, metadata.size);
    asio::error_code ec;
    asio::write(socket, asio::buffer(frame), ec);
    if (ec) {
        throw ConnectionError("failed to send metadata: " + ec.message(), TransferPhase::Metadata, 0);
    }
}

}  // namespace Framing
