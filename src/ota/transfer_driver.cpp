#include "ota/transfer_driver.h"

#include <algorithm>
#include <chrono>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "common/logging/logger.h"
#include "ota/ota_header.h"

namespace otalink::ota {

namespace {
double to_seconds(std::chrono::steady_clock::duration d) {
  return std::chrono::duration<double>(d).count();
}

TransferError to_transfer_error(ChunkStatus status) {
  switch (status) {
    case ChunkStatus::kTimeout:
      return TransferError::kChunkTimeout;
    case ChunkStatus::kSendRejected:
      return TransferError::kSendRejected;
    case ChunkStatus::kTransportFault:
      return TransferError::kTransportFault;
    case ChunkStatus::kDrained:
      break;
  }
  return TransferError::kNone;
}
}  // namespace

const char* to_string(TransferState state) {
  switch (state) {
    case TransferState::kIdle:
      return "idle";
    case TransferState::kSendingFirst:
      return "sending first chunk";
    case TransferState::kSendingRest:
      return "sending remaining chunks";
    case TransferState::kCompleted:
      return "completed";
    case TransferState::kFailed:
      return "failed";
  }
  return "unknown";
}

const char* to_string(TransferError error) {
  switch (error) {
    case TransferError::kNone:
      return "none";
    case TransferError::kInvalidConfig:
      return "invalid configuration";
    case TransferError::kPayloadTooLarge:
      return "payload too large";
    case TransferError::kSetupFailed:
      return "transport setup failed";
    case TransferError::kChunkTimeout:
      return "chunk timeout";
    case TransferError::kSendRejected:
      return "send rejected";
    case TransferError::kTransportFault:
      return "transport fault";
  }
  return "unknown";
}

bool validate_transfer_config(const TransferConfig& config, std::size_t max_unit_size,
                              std::string& error) {
  if (config.max_chunk_size < kHeaderSize) {
    error = "Chunk size must be at least " + std::to_string(kHeaderSize) +
            " bytes to hold the header";
    return false;
  }
  if (config.max_chunk_size > max_unit_size) {
    error = "Chunk size " + std::to_string(config.max_chunk_size) +
            " exceeds transport limit of " + std::to_string(max_unit_size) + " bytes";
    return false;
  }
  if (config.chunk_timeout.count() <= 0) {
    error = "Chunk timeout must be greater than 0";
    return false;
  }
  if (config.chunk_timeout > kMaxChunkTimeout) {
    error = "Chunk timeout must not exceed " + std::to_string(kMaxChunkTimeout.count()) +
            " hours";
    return false;
  }
  if (config.poll_interval.count() <= 0) {
    error = "Poll interval must be greater than 0";
    return false;
  }
  return true;
}

TransferDriver::TransferDriver(TransferConfig config, std::function<TimePoint()> now_fn,
                               ChunkTransmitter::SleepFn sleep_fn)
    : config_(config),
      now_fn_(now_fn),
      transmitter_(ChunkTransmitterConfig{config.chunk_timeout, config.poll_interval},
                   std::move(now_fn), std::move(sleep_fn)) {}

TransferResult TransferDriver::run(std::span<const std::uint8_t> payload,
                                   transport::SegmentationTransport& transport) {
  OTALINK_DCHECK_THREAD(thread_checker_);

  TransferResult result;
  const TimePoint start = now_fn_();
  state_ = TransferState::kIdle;
  offset_ = 0;

  std::string config_error;
  if (!validate_transfer_config(config_, transport.max_unit_size(), config_error)) {
    LOG_ERROR("Invalid transfer configuration: {}", config_error);
    return fail(result, TransferError::kInvalidConfig,
                std::make_error_code(std::errc::invalid_argument));
  }
  if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
    LOG_ERROR("Payload of {} bytes does not fit the 32-bit size field", payload.size());
    return fail(result, TransferError::kPayloadTooLarge,
                std::make_error_code(std::errc::file_too_large));
  }

  // Header chunk.
  state_ = TransferState::kSendingFirst;
  const std::vector<std::uint8_t> first_chunk = make_first_chunk(payload, config_.max_chunk_size);
  const std::size_t first_payload = first_chunk.size() - kHeaderSize;
  LOG_INFO("Sending first chunk: {} bytes (including {} byte header)", first_chunk.size(),
           kHeaderSize);
  if (!send_chunk(transport, first_chunk, 1, result)) {
    result.elapsed = now_fn_() - start;
    return result;
  }
  offset_ = first_payload;
  result.chunks_sent = 1;
  result.bytes_sent = offset_;
  report_progress(1, first_chunk.size(), payload.size());

  // Remaining payload-only chunks.
  state_ = TransferState::kSendingRest;
  while (offset_ < payload.size()) {
    const std::size_t length = std::min(config_.max_chunk_size, payload.size() - offset_);
    const std::size_t chunk_index = result.chunks_sent + 1;
    LOG_INFO("Sending chunk {}: {} bytes", chunk_index, length);
    if (!send_chunk(transport, payload.subspan(offset_, length), chunk_index, result)) {
      result.elapsed = now_fn_() - start;
      return result;
    }
    offset_ += length;
    result.chunks_sent = chunk_index;
    result.bytes_sent = offset_;
    report_progress(chunk_index, length, payload.size());

    // Let the transport settle flow-control bookkeeping before the next unit.
    std::error_code ec;
    if (!transport.process(ec)) {
      LOG_ERROR("Transport failed after chunk {}: {}", chunk_index, ec.message());
      result.failed_chunk = chunk_index;
      fail(result, TransferError::kTransportFault, ec);
      result.elapsed = now_fn_() - start;
      return result;
    }
  }

  state_ = TransferState::kCompleted;
  result.success = true;
  result.elapsed = now_fn_() - start;
  LOG_INFO("Firmware transmission complete: {} chunks, {} bytes total", result.chunks_sent,
           result.bytes_sent);
  return result;
}

bool TransferDriver::send_chunk(transport::SegmentationTransport& transport,
                                std::span<const std::uint8_t> chunk, std::size_t chunk_index,
                                TransferResult& result) {
  std::error_code ec;
  const ChunkResult chunk_result = transmitter_.send(transport, chunk, ec);
  if (chunk_result.ok()) {
    return true;
  }

  LOG_ERROR("Chunk {} failed after {:.3f}s: {}", chunk_index, to_seconds(chunk_result.elapsed),
            to_string(chunk_result.status));
  result.failed_chunk = chunk_index;
  result.chunk_elapsed = chunk_result.elapsed;
  fail(result, to_transfer_error(chunk_result.status), ec);
  return false;
}

void TransferDriver::report_progress(std::size_t chunk_index, std::size_t chunk_size,
                                     std::size_t total) const {
  if (progress_) {
    progress_(ChunkProgress{chunk_index, chunk_size, offset_, total});
  }
}

TransferResult& TransferDriver::fail(TransferResult& result, TransferError error,
                                     std::error_code ec) {
  state_ = TransferState::kFailed;
  result.success = false;
  result.error = error;
  if (!ec && error == TransferError::kChunkTimeout) {
    ec = std::make_error_code(std::errc::timed_out);
  }
  result.ec = ec;
  return result;
}

}  // namespace otalink::ota
