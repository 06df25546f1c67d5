#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <utility>

#include "transport/isotp/segmentation_transport.h"

namespace otalink::transport {

// CAN addressing for one ISO-TP connection. tx_id is the identifier this side
// transmits on, rx_id the one it listens on.
struct IsoTpEndpoint {
  std::string interface{"vcan0"};
  std::uint32_t tx_id{0x7E0};
  std::uint32_t rx_id{0x7E8};
  bool extended_id{false};
};

struct IsoTpStats {
  std::uint64_t units_sent{0};
  std::uint64_t bytes_sent{0};
  std::uint64_t units_received{0};
  std::uint64_t process_steps{0};
};

/**
 * SegmentationTransport backed by the Linux kernel ISO-TP socket (CAN_ISOTP).
 *
 * The kernel performs segmentation, flow control and STmin enforcement. The
 * socket is non-blocking: send() starts a PDU and returns, transmitting()
 * reports whether the kernel still holds it (the socket is not writable while
 * a multi-frame PDU is in progress) or has an error pending. process() drains
 * frames from the peer and surfaces asynchronous errors such as a missing
 * flow-control frame.
 */
class SocketCanIsoTp final : public SegmentationTransport {
 public:
  // Classic ISO-TP first-frame length field limit.
  static constexpr std::size_t kMaxUnitSize = 4095;

  SocketCanIsoTp();
  ~SocketCanIsoTp() override;

  SocketCanIsoTp(const SocketCanIsoTp&) = delete;
  SocketCanIsoTp& operator=(const SocketCanIsoTp&) = delete;
  SocketCanIsoTp(SocketCanIsoTp&&) = delete;
  SocketCanIsoTp& operator=(SocketCanIsoTp&&) = delete;

  // Create the socket, apply flow-control options and bind to the interface.
  // On failure nothing stays open.
  bool open(const IsoTpEndpoint& endpoint, const FlowControlParams& flow_control,
            std::error_code& ec);

  bool send(std::span<const std::uint8_t> unit, std::error_code& ec) override;
  bool process(std::error_code& ec) override;
  bool transmitting() const override;
  std::size_t max_unit_size() const override { return kMaxUnitSize; }
  bool close(std::error_code& ec) override;

  bool is_open() const { return fd_ >= 0; }
  int fd() const { return fd_; }
  const IsoTpEndpoint& endpoint() const { return endpoint_; }
  const IsoTpStats& stats() const { return stats_; }

 private:
  void abort_open();

  int fd_{-1};
  IsoTpEndpoint endpoint_;
  IsoTpStats stats_;
};

// Opens a SocketCanIsoTp on a fixed endpoint.
class SocketCanConnector final : public TransportConnector {
 public:
  explicit SocketCanConnector(IsoTpEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

  std::unique_ptr<SegmentationTransport> open(const FlowControlParams& flow_control,
                                              std::error_code& ec) override;

 private:
  IsoTpEndpoint endpoint_;
};

}  // namespace otalink::transport
