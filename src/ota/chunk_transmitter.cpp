#include "ota/chunk_transmitter.h"

#include <chrono>
#include <thread>
#include <utility>

#include "common/logging/logger.h"

namespace otalink::ota {

namespace {
double to_seconds(std::chrono::steady_clock::duration d) {
  return std::chrono::duration<double>(d).count();
}
}  // namespace

const char* to_string(ChunkStatus status) {
  switch (status) {
    case ChunkStatus::kDrained:
      return "drained";
    case ChunkStatus::kTimeout:
      return "timeout";
    case ChunkStatus::kSendRejected:
      return "send rejected";
    case ChunkStatus::kTransportFault:
      return "transport fault";
  }
  return "unknown";
}

ChunkTransmitter::ChunkTransmitter(ChunkTransmitterConfig config,
                                   std::function<TimePoint()> now_fn, SleepFn sleep_fn)
    : config_(config), now_fn_(std::move(now_fn)), sleep_fn_(std::move(sleep_fn)) {}

void ChunkTransmitter::sleep_for(std::chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

ChunkResult ChunkTransmitter::send(transport::SegmentationTransport& transport,
                                   std::span<const std::uint8_t> chunk, std::error_code& ec) {
  ChunkResult result;
  const TimePoint start = now_fn_();

  if (!transport.send(chunk, ec)) {
    LOG_ERROR("Transport rejected {} byte chunk: {}", chunk.size(), ec.message());
    result.status = ChunkStatus::kSendRejected;
    result.elapsed = now_fn_() - start;
    return result;
  }

  while (transport.transmitting()) {
    ++result.polls;
    if (!transport.process(ec)) {
      LOG_ERROR("Transport failed while draining chunk: {}", ec.message());
      result.status = ChunkStatus::kTransportFault;
      result.elapsed = now_fn_() - start;
      return result;
    }
    if (!transport.transmitting()) {
      break;
    }

    const auto elapsed = now_fn_() - start;
    if (elapsed > config_.timeout) {
      LOG_ERROR("Chunk transmission timeout ({}s, {} polls)", to_seconds(config_.timeout),
                result.polls);
      result.status = ChunkStatus::kTimeout;
      result.elapsed = elapsed;
      return result;
    }
    sleep_fn_(config_.poll_interval);
  }

  result.status = ChunkStatus::kDrained;
  result.elapsed = now_fn_() - start;
  LOG_TRACE("Chunk of {} bytes drained in {:.3f}s after {} polls", chunk.size(),
            to_seconds(result.elapsed), result.polls);
  return result;
}

}  // namespace otalink::ota
