#include "transport/isotp/socketcan_isotp.h"

#include <linux/can.h>
#include <linux/can/isotp.h>
#include <net/if.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <memory>
#include <system_error>

#include "common/logging/logger.h"

namespace {

std::error_code last_error() { return std::error_code(errno, std::generic_category()); }

std::uint32_t to_can_id(std::uint32_t id, bool extended) {
  if (extended) {
    return (id & CAN_EFF_MASK) | CAN_EFF_FLAG;
  }
  return id & CAN_SFF_MASK;
}

}  // namespace

namespace otalink::transport {

SocketCanIsoTp::SocketCanIsoTp() = default;

SocketCanIsoTp::~SocketCanIsoTp() {
  std::error_code ec;
  if (!close(ec)) {
    LOG_WARN("Failed to close ISO-TP socket on {}: {}", endpoint_.interface, ec.message());
  }
}

bool SocketCanIsoTp::open(const IsoTpEndpoint& endpoint, const FlowControlParams& flow_control,
                          std::error_code& ec) {
  if (fd_ >= 0) {
    ec = std::make_error_code(std::errc::already_connected);
    return false;
  }
  if (endpoint.interface.empty() || endpoint.interface.size() >= IFNAMSIZ) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  fd_ = ::socket(PF_CAN, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, CAN_ISOTP);
  if (fd_ < 0) {
    ec = last_error();
    return false;
  }

  // Flow-control values we advertise must be set before bind().
  can_isotp_fc_options fc{};
  fc.bs = flow_control.block_size;
  fc.stmin = flow_control.stmin;
  fc.wftmax = flow_control.wft_max;
  if (::setsockopt(fd_, SOL_CAN_ISOTP, CAN_ISOTP_RECV_FC, &fc, sizeof(fc)) != 0) {
    ec = last_error();
    abort_open();
    return false;
  }

  const unsigned int ifindex = ::if_nametoindex(endpoint.interface.c_str());
  if (ifindex == 0) {
    ec = last_error();
    abort_open();
    return false;
  }

  sockaddr_can addr{};
  addr.can_family = AF_CAN;
  addr.can_ifindex = static_cast<int>(ifindex);
  addr.can_addr.tp.tx_id = to_can_id(endpoint.tx_id, endpoint.extended_id);
  addr.can_addr.tp.rx_id = to_can_id(endpoint.rx_id, endpoint.extended_id);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    ec = last_error();
    abort_open();
    return false;
  }

  endpoint_ = endpoint;
  stats_ = IsoTpStats{};
  LOG_DEBUG("ISO-TP socket bound on {} (TX:0x{:X}, RX:0x{:X}, BS={}, STmin=0x{:02X}, WFTmax={})",
            endpoint.interface, endpoint.tx_id, endpoint.rx_id, flow_control.block_size,
            flow_control.stmin, flow_control.wft_max);
  return true;
}

void SocketCanIsoTp::abort_open() {
  std::error_code close_ec;
  if (!close(close_ec)) {
    LOG_WARN("Failed to release partially opened ISO-TP socket: {}", close_ec.message());
  }
}

bool SocketCanIsoTp::send(std::span<const std::uint8_t> unit, std::error_code& ec) {
  if (fd_ < 0) {
    ec = std::make_error_code(std::errc::not_connected);
    return false;
  }
  if (unit.empty() || unit.size() > kMaxUnitSize) {
    ec = std::make_error_code(std::errc::message_size);
    return false;
  }

  const auto written = ::write(fd_, unit.data(), unit.size());
  if (written < 0) {
    // EAGAIN: the kernel still holds the previous PDU.
    ec = last_error();
    return false;
  }
  if (static_cast<std::size_t>(written) != unit.size()) {
    ec = std::make_error_code(std::errc::io_error);
    return false;
  }

  ++stats_.units_sent;
  stats_.bytes_sent += unit.size();
  return true;
}

bool SocketCanIsoTp::process(std::error_code& ec) {
  if (fd_ < 0) {
    ec = std::make_error_code(std::errc::not_connected);
    return false;
  }
  ++stats_.process_steps;

  pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  const int n = ::poll(&pfd, 1, 0);
  if (n < 0) {
    if (errno == EINTR) {
      return true;
    }
    ec = last_error();
    return false;
  }
  if (n == 0) {
    return true;
  }

  if ((pfd.revents & POLLERR) != 0) {
    int error = 0;
    socklen_t len = sizeof(error);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &error, &len) != 0) {
      ec = last_error();
      return false;
    }
    if (error != 0) {
      ec = std::error_code(error, std::generic_category());
      LOG_ERROR("ISO-TP transport error on {}: {}", endpoint_.interface, ec.message());
      return false;
    }
  }

  if ((pfd.revents & POLLIN) != 0) {
    // The transfer protocol expects nothing back; drain and log whatever arrives.
    std::array<std::uint8_t, kMaxUnitSize> buffer{};
    while (true) {
      const auto read_bytes = ::read(fd_, buffer.data(), buffer.size());
      if (read_bytes < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
          break;
        }
        ec = last_error();
        return false;
      }
      if (read_bytes == 0) {
        break;
      }
      ++stats_.units_received;
      LOG_DEBUG("Discarding {} byte unit received on {}", read_bytes, endpoint_.interface);
    }
  }

  if ((pfd.revents & (POLLHUP | POLLNVAL)) != 0) {
    ec = std::make_error_code(std::errc::connection_reset);
    return false;
  }
  return true;
}

bool SocketCanIsoTp::transmitting() const {
  if (fd_ < 0) {
    return false;
  }
  pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLOUT;
  if (::poll(&pfd, 1, 0) < 0) {
    // Undetermined; report busy and let process() surface the error.
    return true;
  }
  // A PDU the kernel gave up on (e.g. no flow-control frame, ECOMM) leaves the
  // socket writable with an error pending. Stay busy until process() reads it.
  if ((pfd.revents & POLLERR) != 0) {
    return true;
  }
  return (pfd.revents & POLLOUT) == 0;
}

bool SocketCanIsoTp::close(std::error_code& ec) {
  if (fd_ < 0) {
    return true;
  }
  const int rc = ::close(fd_);
  fd_ = -1;
  if (rc != 0) {
    ec = last_error();
    return false;
  }
  LOG_DEBUG("ISO-TP socket on {} closed", endpoint_.interface);
  return true;
}

std::unique_ptr<SegmentationTransport> SocketCanConnector::open(
    const FlowControlParams& flow_control, std::error_code& ec) {
  auto transport = std::make_unique<SocketCanIsoTp>();
  if (!transport->open(endpoint_, flow_control, ec)) {
    return nullptr;
  }
  return transport;
}

}  // namespace otalink::transport
