#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <system_error>
#include <thread>
#include <vector>

#include "fake_transport.h"
#include "transport/isotp/socketcan_isotp.h"

namespace otalink::tests {

namespace {
// True when the error means this host cannot create ISO-TP sockets at all.
bool isotp_unavailable(const std::error_code& ec) {
  return ec == std::errc::address_family_not_supported ||
         ec == std::errc::protocol_not_supported || ec == std::errc::operation_not_permitted;
}
}  // namespace

TEST(SocketCanIsoTpTests, ClosedSocketRejectsOperations) {
  transport::SocketCanIsoTp socket;
  EXPECT_FALSE(socket.is_open());
  EXPECT_FALSE(socket.transmitting());
  EXPECT_EQ(socket.max_unit_size(), 4095U);

  std::error_code ec;
  const std::vector<std::uint8_t> unit{1, 2, 3};
  EXPECT_FALSE(socket.send(unit, ec));
  EXPECT_EQ(ec, std::errc::not_connected);

  ec.clear();
  EXPECT_FALSE(socket.process(ec));
  EXPECT_EQ(ec, std::errc::not_connected);

  ec.clear();
  EXPECT_TRUE(socket.close(ec));
  EXPECT_TRUE(socket.close(ec));
  EXPECT_FALSE(ec);
}

TEST(SocketCanIsoTpTests, RejectsInvalidInterfaceName) {
  transport::SocketCanIsoTp socket;
  std::error_code ec;
  transport::IsoTpEndpoint endpoint;
  endpoint.interface = "";
  EXPECT_FALSE(socket.open(endpoint, {}, ec));
  EXPECT_EQ(ec, std::errc::invalid_argument);

  endpoint.interface = "an-interface-name-too-long";
  ec.clear();
  EXPECT_FALSE(socket.open(endpoint, {}, ec));
  EXPECT_EQ(ec, std::errc::invalid_argument);
  EXPECT_FALSE(socket.is_open());
}

TEST(SocketCanIsoTpTests, MissingInterfaceFailsWithoutLeakingSocket) {
  transport::SocketCanIsoTp socket;
  transport::IsoTpEndpoint endpoint;
  endpoint.interface = "otalinknone0";
  std::error_code ec;
  ASSERT_FALSE(socket.open(endpoint, {}, ec));
  if (isotp_unavailable(ec)) {
    GTEST_SKIP() << "ISO-TP sockets not available: " << ec.message();
  }
  EXPECT_EQ(ec, std::errc::no_such_device);
  EXPECT_FALSE(socket.is_open());
  EXPECT_EQ(socket.fd(), -1);
}

TEST(SocketCanIsoTpTests, ConnectorReportsSetupFailure) {
  transport::IsoTpEndpoint endpoint;
  endpoint.interface = "otalinknone0";
  transport::SocketCanConnector connector(endpoint);
  std::error_code ec;
  auto transport = connector.open({}, ec);
  EXPECT_EQ(transport, nullptr);
  EXPECT_TRUE(static_cast<bool>(ec));
}

TEST(SocketCanIsoTpTests, RejectsOversizedUnitBeforeWriting) {
  transport::SocketCanIsoTp socket;
  transport::IsoTpEndpoint endpoint;
  endpoint.interface = "vcan0";
  std::error_code ec;
  if (!socket.open(endpoint, {}, ec)) {
    GTEST_SKIP() << "vcan0 not available: " << ec.message();
  }
  const std::vector<std::uint8_t> oversized(transport::SocketCanIsoTp::kMaxUnitSize + 1);
  EXPECT_FALSE(socket.send(oversized, ec));
  EXPECT_EQ(ec, std::errc::message_size);
  EXPECT_EQ(socket.stats().units_sent, 0U);
}

TEST(SocketCanIsoTpTests, MultiFrameUnitDrainsOverVirtualBus) {
  transport::IsoTpEndpoint sender_ep;
  sender_ep.interface = "vcan0";
  sender_ep.tx_id = 0x7E0;
  sender_ep.rx_id = 0x7E8;
  transport::IsoTpEndpoint receiver_ep = sender_ep;
  receiver_ep.tx_id = 0x7E8;
  receiver_ep.rx_id = 0x7E0;

  transport::SocketCanIsoTp receiver;
  std::error_code ec;
  if (!receiver.open(receiver_ep, {}, ec)) {
    GTEST_SKIP() << "vcan0 not available: " << ec.message();
  }
  transport::SocketCanIsoTp sender;
  ASSERT_TRUE(sender.open(sender_ep, {}, ec)) << ec.message();

  const auto unit = make_payload(300);
  ASSERT_TRUE(sender.send(unit, ec)) << ec.message();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while ((sender.transmitting() || receiver.stats().units_received == 0) &&
         std::chrono::steady_clock::now() < deadline) {
    ASSERT_TRUE(sender.process(ec)) << ec.message();
    ASSERT_TRUE(receiver.process(ec)) << ec.message();
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  EXPECT_FALSE(sender.transmitting());
  EXPECT_EQ(receiver.stats().units_received, 1U);
  EXPECT_EQ(sender.stats().units_sent, 1U);
  EXPECT_EQ(sender.stats().bytes_sent, 300U);
}

// Nobody answers on these identifiers, so the kernel abandons the PDU after
// its flow-control timeout and leaves ECOMM pending on the socket.
TEST(SocketCanIsoTpTests, MissingFlowControlSurfacesThroughProcess) {
  transport::IsoTpEndpoint endpoint;
  endpoint.interface = "vcan0";
  endpoint.tx_id = 0x6F0;
  endpoint.rx_id = 0x6F8;

  transport::SocketCanIsoTp socket;
  std::error_code ec;
  if (!socket.open(endpoint, {}, ec)) {
    GTEST_SKIP() << "vcan0 not available: " << ec.message();
  }
  ASSERT_TRUE(socket.send(make_payload(300), ec)) << ec.message();

  bool faulted = false;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (socket.transmitting() && std::chrono::steady_clock::now() < deadline) {
    if (!socket.process(ec)) {
      faulted = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  EXPECT_TRUE(faulted);
  EXPECT_TRUE(static_cast<bool>(ec));
}

}  // namespace otalink::tests
