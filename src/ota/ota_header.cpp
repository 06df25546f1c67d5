#include "ota/ota_header.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace {

void write_le32(std::uint8_t* out, std::uint32_t value) {
  out[0] = static_cast<std::uint8_t>(value & 0xFF);
  out[1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
  out[2] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
  out[3] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
}

std::uint16_t read_le16(std::span<const std::uint8_t> data, std::size_t offset) {
  return static_cast<std::uint16_t>(data[offset] | (data[offset + 1] << 8));
}

std::uint32_t read_le32(std::span<const std::uint8_t> data, std::size_t offset) {
  return static_cast<std::uint32_t>(data[offset]) |
         (static_cast<std::uint32_t>(data[offset + 1]) << 8) |
         (static_cast<std::uint32_t>(data[offset + 2]) << 16) |
         (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}

}  // namespace

namespace otalink::ota {

HeaderBytes build_header(std::uint32_t total_size) {
  HeaderBytes header{};
  header[0] = kMagic0;
  header[1] = kMagic1;
  write_le32(&header[2], total_size);
  header[6] = 0x00;
  header[7] = 0x00;
  return header;
}

std::optional<OtaHeader> parse_header(std::span<const std::uint8_t> unit) {
  if (unit.size() < kHeaderSize) {
    return std::nullopt;
  }
  if (unit[0] != kMagic0 || unit[1] != kMagic1) {
    return std::nullopt;
  }
  OtaHeader header;
  header.total_size = read_le32(unit, 2);
  header.reserved = read_le16(unit, 6);
  if (header.reserved != 0) {
    return std::nullopt;
  }
  return header;
}

std::size_t first_chunk_split(std::size_t header_len, std::size_t max_chunk_size,
                              [[maybe_unused]] std::size_t payload_len) {
  return max_chunk_size > header_len ? max_chunk_size - header_len : 0;
}

std::vector<std::uint8_t> make_first_chunk(std::span<const std::uint8_t> payload,
                                           std::size_t max_chunk_size) {
  const auto header = build_header(static_cast<std::uint32_t>(payload.size()));
  const std::size_t n0 =
      std::min(first_chunk_split(kHeaderSize, max_chunk_size, payload.size()), payload.size());

  std::vector<std::uint8_t> chunk;
  chunk.reserve(kHeaderSize + n0);
  chunk.insert(chunk.end(), header.begin(), header.end());
  chunk.insert(chunk.end(), payload.begin(), payload.begin() + static_cast<std::ptrdiff_t>(n0));
  return chunk;
}

std::vector<ChunkSpan> plan_chunks(std::size_t payload_len, std::size_t max_chunk_size) {
  std::vector<ChunkSpan> plan;
  if (max_chunk_size == 0) {
    return plan;
  }

  const std::size_t n0 =
      std::min(first_chunk_split(kHeaderSize, max_chunk_size, payload_len), payload_len);
  plan.push_back(ChunkSpan{0, n0});

  std::size_t offset = n0;
  while (offset < payload_len) {
    const std::size_t length = std::min(max_chunk_size, payload_len - offset);
    plan.push_back(ChunkSpan{offset, length});
    offset += length;
  }
  return plan;
}

}  // namespace otalink::ota
