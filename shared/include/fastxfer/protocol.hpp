#pragma once

#include "byte_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace fastxfer {

// Wire format, one transfer per connection:
//   u16 name_length (BE) | name_length bytes of name | u64 size (BE) | size bytes of body
constexpr std::size_t kChunkSize = 64 * 1024;
constexpr std::size_t kNameLengthBytes = 2;
constexpr std::size_t kSizeBytes = 8;
constexpr std::size_t kMaxNameLength = 0xFFFF;

struct TransferHeader {
    std::string name;
    std::uint64_t size = 0;
};

std::string encode_header(const std::string &name, std::uint64_t size);

// throws TransferError(Protocol) when the stream ends before the header is complete
TransferHeader decode_header(ByteReader &reader);

} // namespace fastxfer
