#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <system_error>
#include <utility>

#include "common/utils/thread_checker.h"
#include "ota/chunk_transmitter.h"
#include "transport/isotp/segmentation_transport.h"

namespace otalink::ota {

enum class TransferState : std::uint8_t {
  kIdle = 0,
  kSendingFirst = 1,  // Header chunk in flight
  kSendingRest = 2,   // Payload-only chunks in flight
  kCompleted = 3,
  kFailed = 4
};

enum class TransferError : std::uint8_t {
  kNone = 0,
  kInvalidConfig = 1,
  kPayloadTooLarge = 2,  // Does not fit the 32-bit size field
  kSetupFailed = 3,      // Transport could not be opened
  kChunkTimeout = 4,
  kSendRejected = 5,
  kTransportFault = 6
};

const char* to_string(TransferState state);
const char* to_string(TransferError error);

// Longest per-chunk timeout accepted; keeps deadline arithmetic within the
// range of steady_clock::duration.
constexpr std::chrono::hours kMaxChunkTimeout{24};

struct TransferConfig {
  // Upper bound on every unit handed to the transport, header included.
  std::size_t max_chunk_size{2048};
  // Forwarded to the transport when it is opened.
  transport::FlowControlParams flow_control{};
  std::chrono::milliseconds chunk_timeout{15000};
  std::chrono::milliseconds poll_interval{1};
};

// Reported after every drained chunk.
struct ChunkProgress {
  std::size_t chunk_index{0};  // 1-based
  std::size_t chunk_size{0};   // Bytes handed to the transport, header included
  std::size_t bytes_sent{0};   // Payload bytes drained so far
  std::size_t total_bytes{0};  // Payload length
};

struct TransferResult {
  bool success{false};
  std::size_t chunks_sent{0};
  std::size_t bytes_sent{0};  // Payload bytes only
  TransferError error{TransferError::kNone};
  // 1-based index of the chunk that failed, 0 when no chunk failed.
  std::size_t failed_chunk{0};
  std::chrono::steady_clock::duration chunk_elapsed{};  // Time spent on the failed chunk
  std::chrono::steady_clock::duration elapsed{};        // Whole transfer
  std::error_code ec;
  // Releasing the transport failed; does not affect success.
  bool teardown_failed{false};
};

// Checks a configuration against a transport's unit limit.
bool validate_transfer_config(const TransferConfig& config, std::size_t max_unit_size,
                              std::string& error);

/**
 * Drives one payload through a segmentation transport.
 *
 * Sequence: header plus the first max_chunk_size - 8 payload bytes, then
 * payload-only chunks of at most max_chunk_size bytes. Each chunk is fully
 * drained before the next is queued, and one extra process() step runs after
 * every payload-only chunk. The first failure ends the transfer; offset and
 * chunk count stay where the failure left them.
 *
 * Thread Safety:
 *   Not thread-safe. run() must be called from the thread that created the
 *   driver.
 */
class TransferDriver {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using ProgressHandler = std::function<void(const ChunkProgress&)>;

  explicit TransferDriver(TransferConfig config, std::function<TimePoint()> now_fn = Clock::now,
                          ChunkTransmitter::SleepFn sleep_fn = ChunkTransmitter::sleep_for);

  void set_progress_handler(ProgressHandler handler) { progress_ = std::move(handler); }

  TransferResult run(std::span<const std::uint8_t> payload,
                     transport::SegmentationTransport& transport);

  TransferState state() const { return state_; }
  std::size_t offset() const { return offset_; }
  const TransferConfig& config() const { return config_; }

 private:
  bool send_chunk(transport::SegmentationTransport& transport, std::span<const std::uint8_t> chunk,
                  std::size_t chunk_index, TransferResult& result);
  void report_progress(std::size_t chunk_index, std::size_t chunk_size, std::size_t total) const;
  TransferResult& fail(TransferResult& result, TransferError error, std::error_code ec);

  TransferConfig config_;
  std::function<TimePoint()> now_fn_;
  ChunkTransmitter transmitter_;
  ProgressHandler progress_;

  TransferState state_{TransferState::kIdle};
  std::size_t offset_{0};

  OTALINK_THREAD_CHECKER(thread_checker_);
};

}  // namespace otalink::ota
