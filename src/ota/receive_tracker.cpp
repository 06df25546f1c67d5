#include "ota/receive_tracker.h"

#include "common/logging/logger.h"

namespace otalink::ota {

const char* to_string(ReceiveStatus status) {
  switch (status) {
    case ReceiveStatus::kNeedMore:
      return "need more";
    case ReceiveStatus::kComplete:
      return "complete";
    case ReceiveStatus::kBadHeader:
      return "bad header";
    case ReceiveStatus::kOverrun:
      return "overrun";
  }
  return "unknown";
}

ReceiveStatus ReceiveTracker::consume(std::span<const std::uint8_t> unit) {
  if (status_ == ReceiveStatus::kBadHeader || status_ == ReceiveStatus::kOverrun) {
    return status_;
  }
  ++units_received_;

  if (!header_) {
    header_ = parse_header(unit);
    if (!header_) {
      LOG_WARN("First unit ({} bytes) does not carry a valid OTA header", unit.size());
      status_ = ReceiveStatus::kBadHeader;
      return status_;
    }
    LOG_DEBUG("OTA header accepted, {} payload bytes announced", header_->total_size);
    return account(unit.size() - kHeaderSize);
  }

  if (status_ == ReceiveStatus::kComplete && !unit.empty()) {
    status_ = ReceiveStatus::kOverrun;
    LOG_WARN("Received {} bytes after transfer completed", unit.size());
    return status_;
  }
  return account(unit.size());
}

ReceiveStatus ReceiveTracker::account(std::size_t payload_bytes) {
  bytes_received_ += payload_bytes;
  if (bytes_received_ > header_->total_size) {
    LOG_WARN("Received {} payload bytes, header announced {}", bytes_received_,
             header_->total_size);
    status_ = ReceiveStatus::kOverrun;
  } else if (bytes_received_ == header_->total_size) {
    status_ = ReceiveStatus::kComplete;
  } else {
    status_ = ReceiveStatus::kNeedMore;
  }
  return status_;
}

void ReceiveTracker::reset() {
  header_.reset();
  status_ = ReceiveStatus::kNeedMore;
  units_received_ = 0;
  bytes_received_ = 0;
}

std::uint64_t ReceiveTracker::bytes_remaining() const {
  if (!header_ || bytes_received_ >= header_->total_size) {
    return 0;
  }
  return header_->total_size - bytes_received_;
}

}  // namespace otalink::ota
