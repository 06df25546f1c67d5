#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <span>
#include <system_error>

#include "transport/isotp/segmentation_transport.h"

namespace otalink::ota {

enum class ChunkStatus : std::uint8_t {
  kDrained = 0,         // Every frame of the chunk was accepted by the transport
  kTimeout = 1,         // Still transmitting when the timeout elapsed
  kSendRejected = 2,    // transport.send() refused the chunk
  kTransportFault = 3   // transport.process() reported an error while draining
};

const char* to_string(ChunkStatus status);

struct ChunkTransmitterConfig {
  // Upper bound on the time from submission until the chunk is drained.
  std::chrono::milliseconds timeout{15000};
  // Pause between process() steps while the chunk drains.
  std::chrono::milliseconds poll_interval{1};
};

struct ChunkResult {
  ChunkStatus status{ChunkStatus::kDrained};
  std::chrono::steady_clock::duration elapsed{};
  std::uint64_t polls{0};

  bool ok() const { return status == ChunkStatus::kDrained; }
};

/**
 * Hands one chunk to a segmentation transport and blocks until the transport
 * has drained it or the timeout elapses.
 *
 * The wait is cooperative: process() is called, the drain predicate is
 * re-checked, and the thread sleeps for poll_interval between steps. A
 * timeout is final; the transport is left in whatever state it was in.
 *
 * Clock and sleep are injectable so tests can drive time explicitly.
 */
class ChunkTransmitter {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  explicit ChunkTransmitter(ChunkTransmitterConfig config = {},
                            std::function<TimePoint()> now_fn = Clock::now,
                            SleepFn sleep_fn = sleep_for);

  // On kSendRejected and kTransportFault, ec carries the transport's error.
  ChunkResult send(transport::SegmentationTransport& transport,
                   std::span<const std::uint8_t> chunk, std::error_code& ec);

  const ChunkTransmitterConfig& config() const { return config_; }

  static void sleep_for(std::chrono::milliseconds duration);

 private:
  ChunkTransmitterConfig config_;
  std::function<TimePoint()> now_fn_;
  SleepFn sleep_fn_;
};

}  // namespace otalink::ota
