#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "ota/ota_header.h"

namespace otalink::ota {

enum class ReceiveStatus : std::uint8_t {
  kNeedMore = 0,   // Header accepted, more payload expected
  kComplete = 1,   // Declared size reached exactly
  kBadHeader = 2,  // First unit did not start with a valid header
  kOverrun = 3     // More payload arrived than the header declared
};

const char* to_string(ReceiveStatus status);

// Accounts for units arriving at the receiving end of a transfer: the first
// unit must carry the header, the rest are counted against its size field.
// Payload bytes are counted, never stored. Once an error status is returned
// the tracker stays in it until reset().
class ReceiveTracker {
 public:
  ReceiveStatus consume(std::span<const std::uint8_t> unit);
  void reset();

  ReceiveStatus status() const { return status_; }
  const std::optional<OtaHeader>& header() const { return header_; }
  std::size_t units_received() const { return units_received_; }
  std::uint64_t bytes_received() const { return bytes_received_; }
  std::uint64_t bytes_remaining() const;

 private:
  ReceiveStatus account(std::size_t payload_bytes);

  std::optional<OtaHeader> header_;
  ReceiveStatus status_{ReceiveStatus::kNeedMore};
  std::size_t units_received_{0};
  std::uint64_t bytes_received_{0};
};

}  // namespace otalink::ota
