#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace otalink::ota {

// OTA header prepended to the first chunk of a transfer.
// Wire format (8 bytes):
//   [magic0: 1 byte, 'O' (0x4F)]
//   [magic1: 1 byte, 'T' (0x54)]
//   [total_size: 4 bytes little-endian]
//   [reserved: 2 bytes, zero]
// The header has no checksum; integrity is left to the segmentation transport.
constexpr std::uint8_t kMagic0 = 0x4F;
constexpr std::uint8_t kMagic1 = 0x54;
constexpr std::size_t kHeaderSize = 8;

using HeaderBytes = std::array<std::uint8_t, kHeaderSize>;

struct OtaHeader {
  std::uint32_t total_size{0};
  std::uint16_t reserved{0};
};

// Payload slice carried by one chunk, in transmission order.
struct ChunkSpan {
  std::size_t offset{0};
  std::size_t length{0};
};

// Build the header for a payload of total_size bytes.
HeaderBytes build_header(std::uint32_t total_size);

// Parse a header from the front of a received unit. Returns nullopt when the
// unit is shorter than kHeaderSize, the magic is wrong or reserved is non-zero.
std::optional<OtaHeader> parse_header(std::span<const std::uint8_t> unit);

// Number of payload bytes the first chunk may carry: max(0, max_chunk_size - header_len).
// The caller clamps to the payload length when slicing.
std::size_t first_chunk_split(std::size_t header_len, std::size_t max_chunk_size,
                              std::size_t payload_len);

// Header followed by the first min(n0, payload.size()) payload bytes.
std::vector<std::uint8_t> make_first_chunk(std::span<const std::uint8_t> payload,
                                           std::size_t max_chunk_size);

// Payload slices of every chunk. The first entry is always present and may be
// empty (header-only chunk). max_chunk_size must be non-zero.
std::vector<ChunkSpan> plan_chunks(std::size_t payload_len, std::size_t max_chunk_size);

}  // namespace otalink::ota
