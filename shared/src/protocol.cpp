#include "fastxfer/protocol.hpp"
#include "fastxfer/errors.hpp"

#include <array>

namespace fastxfer {

namespace {

void read_field(ByteReader &reader, char *buffer, std::size_t length, const char *field) {
    std::size_t got = read_full(reader, buffer, length);
    if (got != length) {
        throw TransferError(ErrorKind::Protocol,
                            std::string("truncated header: ") + field + " needs " + std::to_string(length) +
                                " bytes, got " + std::to_string(got));
    }
}

} // namespace

std::string encode_header(const std::string &name, std::uint64_t size) {
    if (name.size() > kMaxNameLength) {
        throw TransferError(ErrorKind::Setup, "file name too long for header: " + std::to_string(name.size()) + " bytes");
    }
    std::string out;
    out.reserve(kNameLengthBytes + name.size() + kSizeBytes);

    auto length = static_cast<std::uint16_t>(name.size());
    out.push_back(static_cast<char>((length >> 8) & 0xFF));
    out.push_back(static_cast<char>(length & 0xFF));
    out.append(name);
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((size >> shift) & 0xFF));
    }
    return out;
}

TransferHeader decode_header(ByteReader &reader) {
    TransferHeader header;

    std::array<unsigned char, kNameLengthBytes> length_bytes{};
    read_field(reader, reinterpret_cast<char *>(length_bytes.data()), length_bytes.size(), "name length");
    std::size_t name_length = (static_cast<std::size_t>(length_bytes[0]) << 8) | length_bytes[1];

    header.name.resize(name_length);
    if (name_length > 0) {
        read_field(reader, header.name.data(), name_length, "name");
    }

    std::array<unsigned char, kSizeBytes> size_bytes{};
    read_field(reader, reinterpret_cast<char *>(size_bytes.data()), size_bytes.size(), "size");
    for (unsigned char byte : size_bytes) {
        header.size = (header.size << 8) | byte;
    }
    return header;
}

} // namespace fastxfer
