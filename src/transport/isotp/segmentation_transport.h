#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <system_error>

namespace otalink::transport {

// Flow-control values this side advertises to its peer. They are forwarded to
// the transport as-is; nothing above the transport interprets them.
struct FlowControlParams {
  // Consecutive frames per flow-control window (0 = no further FC frames).
  std::uint8_t block_size{8};
  // Minimum separation time, raw ISO 15765-2 encoding
  // (0x00-0x7F milliseconds, 0xF1-0xF9 100-900 microseconds).
  std::uint8_t stmin{0};
  // Maximum number of wait frames (0 disables wait-frame extension).
  std::uint8_t wft_max{0};
};

/**
 * Segmentation/reassembly transport (ISO-TP style) as seen by the chunked
 * transfer core.
 *
 * A unit handed to send() is split into link-layer frames by the transport
 * and transmitted under the peer's flow-control window. The caller drives the
 * transport by invoking process() repeatedly, at least as often as the
 * negotiated separation time requires; the transport schedules nothing on its
 * own unless an implementation documents otherwise.
 *
 * Thread Safety:
 *   Implementations synchronize internally if they share state with a worker
 *   of their own. Callers perform no locking.
 */
class SegmentationTransport {
 public:
  virtual ~SegmentationTransport() = default;

  // Enqueue one complete application unit. Fails synchronously when the
  // transport is not ready or the unit is invalid (e.g. larger than
  // max_unit_size()).
  virtual bool send(std::span<const std::uint8_t> unit, std::error_code& ec) = 0;

  // One non-blocking step: advance frame transmission, consume incoming
  // frames, surface asynchronous transport errors through ec.
  virtual bool process(std::error_code& ec) = 0;

  // True while the most recent unit still has frames outstanding, and while
  // an asynchronous error is pending that the next process() will report.
  virtual bool transmitting() const = 0;

  // Largest unit send() accepts.
  virtual std::size_t max_unit_size() const = 0;

  // Release the underlying medium. Idempotent.
  virtual bool close(std::error_code& ec) = 0;
};

// Acquires a transport with the given flow-control parameters applied.
class TransportConnector {
 public:
  virtual ~TransportConnector() = default;

  // Returns nullptr and sets ec when the medium cannot be opened. Anything
  // acquired before the failure has already been released.
  virtual std::unique_ptr<SegmentationTransport> open(const FlowControlParams& flow_control,
                                                      std::error_code& ec) = 0;
};

}  // namespace otalink::transport
