#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

#include "fake_transport.h"
#include "ota/ota_header.h"
#include "ota/receive_tracker.h"
#include "ota/transfer_driver.h"

namespace otalink::ota::tests {

using namespace std::chrono_literals;
using otalink::tests::FakeClock;
using otalink::tests::FakeSegmentationTransport;
using otalink::tests::FakeTransportScript;
using otalink::tests::make_payload;

class TransferDriverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.max_chunk_size = 2048;
    config_.chunk_timeout = 50ms;
    config_.poll_interval = 1ms;
    script_.steps_to_drain = 2;
  }

  TransferDriver make_driver() {
    return TransferDriver(config_, clock_.now_fn(), clock_.sleep_fn());
  }

  // Payload portions of every recorded unit, header stripped from the first.
  static std::vector<std::uint8_t> reassemble(const std::vector<std::vector<std::uint8_t>>& units) {
    std::vector<std::uint8_t> out;
    for (std::size_t i = 0; i < units.size(); ++i) {
      const std::size_t skip = i == 0 ? kHeaderSize : 0;
      out.insert(out.end(), units[i].begin() + static_cast<std::ptrdiff_t>(skip), units[i].end());
    }
    return out;
  }

  FakeClock clock_;
  TransferConfig config_;
  FakeTransportScript script_;
};

TEST_F(TransferDriverTest, SmallPayloadFitsInOneChunk) {
  std::vector<std::uint8_t> payload(64);
  for (std::size_t i = 0; i < payload.size(); ++i) {
    payload[i] = static_cast<std::uint8_t>(i);
  }
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();

  const auto result = driver.run(payload, transport);

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.error, TransferError::kNone);
  EXPECT_EQ(result.chunks_sent, 1U);
  EXPECT_EQ(result.bytes_sent, 64U);
  EXPECT_EQ(driver.state(), TransferState::kCompleted);
  ASSERT_EQ(transport.log().units.size(), 1U);
  EXPECT_EQ(transport.log().units[0].size(), 72U);
  auto header = parse_header(transport.log().units[0]);
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->total_size, 64U);
}

TEST_F(TransferDriverTest, FiveThousandBytesTakeThreeChunks) {
  const auto payload = make_payload(5000);
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();

  const auto result = driver.run(payload, transport);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.chunks_sent, 3U);
  EXPECT_EQ(result.bytes_sent, 5000U);
  const auto& units = transport.log().units;
  ASSERT_EQ(units.size(), 3U);
  EXPECT_EQ(units[0].size(), 2048U);
  EXPECT_EQ(units[1].size(), 2048U);
  EXPECT_EQ(units[2].size(), 912U);
  EXPECT_EQ(reassemble(units), payload);
}

TEST_F(TransferDriverTest, EmptyPayloadSendsHeaderOnly) {
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();

  const auto result = driver.run({}, transport);

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.chunks_sent, 1U);
  EXPECT_EQ(result.bytes_sent, 0U);
  ASSERT_EQ(transport.log().units.size(), 1U);
  EXPECT_EQ(transport.log().units[0].size(), kHeaderSize);
}

TEST_F(TransferDriverTest, ExactFitIsOneChunkAndOneMoreByteIsTwo) {
  config_.max_chunk_size = 256;
  {
    FakeSegmentationTransport transport(script_);
    auto driver = make_driver();
    const auto result = driver.run(make_payload(256 - kHeaderSize), transport);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.chunks_sent, 1U);
    ASSERT_EQ(transport.log().units.size(), 1U);
    EXPECT_EQ(transport.log().units[0].size(), 256U);
  }
  {
    FakeSegmentationTransport transport(script_);
    auto driver = make_driver();
    const auto result = driver.run(make_payload(256 - kHeaderSize + 1), transport);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.chunks_sent, 2U);
    ASSERT_EQ(transport.log().units.size(), 2U);
    EXPECT_EQ(transport.log().units[1].size(), 1U);
  }
}

TEST_F(TransferDriverTest, HeaderSizedChunksSendHeaderAlone) {
  config_.max_chunk_size = kHeaderSize;
  const auto payload = make_payload(20);
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();

  const auto result = driver.run(payload, transport);

  ASSERT_TRUE(result.success);
  const auto& units = transport.log().units;
  ASSERT_EQ(units.size(), 4U);
  EXPECT_EQ(units[0].size(), 8U);
  EXPECT_EQ(units[1].size(), 8U);
  EXPECT_EQ(units[2].size(), 8U);
  EXPECT_EQ(units[3].size(), 4U);
  EXPECT_EQ(reassemble(units), payload);
}

TEST_F(TransferDriverTest, UnitsReassembleAndStayWithinLimit) {
  config_.max_chunk_size = 100;
  const auto payload = make_payload(10000);
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();

  const auto result = driver.run(payload, transport);

  ASSERT_TRUE(result.success);
  const auto& units = transport.log().units;
  EXPECT_EQ(result.chunks_sent, units.size());
  for (const auto& unit : units) {
    EXPECT_LE(unit.size(), config_.max_chunk_size);
  }
  EXPECT_EQ(reassemble(units), payload);

  ReceiveTracker tracker;
  ReceiveStatus status = ReceiveStatus::kNeedMore;
  for (const auto& unit : units) {
    status = tracker.consume(unit);
  }
  EXPECT_EQ(status, ReceiveStatus::kComplete);
  EXPECT_EQ(tracker.bytes_received(), payload.size());
}

TEST_F(TransferDriverTest, ProcessesOnceAfterEveryPayloadOnlyChunk) {
  script_.steps_to_drain = 0;
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();

  const auto result = driver.run(make_payload(5000), transport);

  ASSERT_TRUE(result.success);
  // Units drain on send, so every process() call is the post-chunk step.
  EXPECT_EQ(transport.log().process_calls, 2U);
  EXPECT_EQ(transport.log().idle_process_calls, 2U);
}

TEST_F(TransferDriverTest, TimeoutFreezesProgressAtFailingChunk) {
  script_.stall_at = 2;
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();

  const auto result = driver.run(make_payload(8000), transport);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, TransferError::kChunkTimeout);
  EXPECT_EQ(result.ec, std::errc::timed_out);
  EXPECT_EQ(result.failed_chunk, 3U);
  EXPECT_EQ(result.chunks_sent, 2U);
  EXPECT_EQ(result.bytes_sent, 2040U + 2048U);
  EXPECT_GE(result.chunk_elapsed, config_.chunk_timeout);
  EXPECT_EQ(driver.state(), TransferState::kFailed);
  EXPECT_EQ(driver.offset(), 2040U + 2048U);
  // Nothing is attempted after the failing chunk.
  EXPECT_EQ(transport.log().units.size(), 3U);
}

TEST_F(TransferDriverTest, FirstChunkRejectionAbortsTransfer) {
  script_.reject_send_at = 0;
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();

  const auto result = driver.run(make_payload(5000), transport);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, TransferError::kSendRejected);
  EXPECT_EQ(result.ec, std::errc::message_size);
  EXPECT_EQ(result.failed_chunk, 1U);
  EXPECT_EQ(result.chunks_sent, 0U);
  EXPECT_EQ(result.bytes_sent, 0U);
  EXPECT_TRUE(transport.log().units.empty());
}

TEST_F(TransferDriverTest, FaultInPostChunkStepAbortsTransfer) {
  script_.steps_to_drain = 0;
  script_.fail_process_at = 1;
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();

  const auto result = driver.run(make_payload(5000), transport);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, TransferError::kTransportFault);
  EXPECT_EQ(result.failed_chunk, 2U);
  EXPECT_EQ(result.chunks_sent, 2U);
  EXPECT_EQ(transport.log().units.size(), 2U);
}

TEST_F(TransferDriverTest, SingleChunkWithPendingErrorFails) {
  script_.steps_to_drain = 0;
  script_.pending_error_at = 0;
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();

  const auto result = driver.run(make_payload(64), transport);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, TransferError::kTransportFault);
  EXPECT_EQ(result.ec, std::error_code(ECOMM, std::generic_category()));
  EXPECT_EQ(result.failed_chunk, 1U);
  EXPECT_EQ(result.chunks_sent, 0U);
  EXPECT_EQ(result.bytes_sent, 0U);
  EXPECT_EQ(driver.state(), TransferState::kFailed);
}

TEST_F(TransferDriverTest, PendingErrorIsChargedToItsOwnChunk) {
  script_.pending_error_at = 1;
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();

  const auto result = driver.run(make_payload(5000), transport);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, TransferError::kTransportFault);
  EXPECT_EQ(result.failed_chunk, 2U);
  EXPECT_EQ(result.chunks_sent, 1U);
  EXPECT_EQ(result.bytes_sent, 2040U);
  EXPECT_EQ(transport.log().units.size(), 2U);
}

TEST_F(TransferDriverTest, ReportsProgressPerChunk) {
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();
  std::vector<ChunkProgress> progress;
  driver.set_progress_handler([&](const ChunkProgress& p) { progress.push_back(p); });

  const auto result = driver.run(make_payload(5000), transport);

  ASSERT_TRUE(result.success);
  ASSERT_EQ(progress.size(), 3U);
  EXPECT_EQ(progress[0].chunk_index, 1U);
  EXPECT_EQ(progress[0].chunk_size, 2048U);
  EXPECT_EQ(progress[0].bytes_sent, 2040U);
  EXPECT_EQ(progress[1].chunk_index, 2U);
  EXPECT_EQ(progress[1].bytes_sent, 4088U);
  EXPECT_EQ(progress[2].chunk_index, 3U);
  EXPECT_EQ(progress[2].chunk_size, 912U);
  EXPECT_EQ(progress[2].bytes_sent, 5000U);
  for (const auto& p : progress) {
    EXPECT_EQ(p.total_bytes, 5000U);
  }
}

TEST_F(TransferDriverTest, RejectsChunkSizeSmallerThanHeader) {
  config_.max_chunk_size = kHeaderSize - 1;
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();

  const auto result = driver.run(make_payload(10), transport);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, TransferError::kInvalidConfig);
  EXPECT_TRUE(transport.log().units.empty());
}

TEST_F(TransferDriverTest, RejectsChunkSizeAboveTransportLimit) {
  script_.unit_limit = 1024;
  config_.max_chunk_size = 2048;
  FakeSegmentationTransport transport(script_);
  auto driver = make_driver();

  const auto result = driver.run(make_payload(10), transport);

  EXPECT_EQ(result.error, TransferError::kInvalidConfig);
  EXPECT_EQ(result.ec, std::errc::invalid_argument);
  EXPECT_TRUE(transport.log().units.empty());
}

TEST_F(TransferDriverTest, DriverCanBeReused) {
  auto driver = make_driver();
  {
    FakeSegmentationTransport transport(script_);
    EXPECT_TRUE(driver.run(make_payload(3000), transport).success);
  }
  {
    FakeSegmentationTransport transport(script_);
    const auto result = driver.run(make_payload(100), transport);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.chunks_sent, 1U);
    EXPECT_EQ(driver.offset(), 100U);
  }
}

TEST(TransferConfigTests, Validation) {
  TransferConfig config;
  std::string error;
  EXPECT_TRUE(validate_transfer_config(config, 4095, error));

  config.max_chunk_size = 4096;
  EXPECT_FALSE(validate_transfer_config(config, 4095, error));
  EXPECT_FALSE(error.empty());

  config.max_chunk_size = 2048;
  config.chunk_timeout = std::chrono::milliseconds(0);
  EXPECT_FALSE(validate_transfer_config(config, 4095, error));

  config.chunk_timeout = std::chrono::milliseconds(100);
  config.poll_interval = std::chrono::milliseconds(0);
  EXPECT_FALSE(validate_transfer_config(config, 4095, error));

  config.poll_interval = std::chrono::milliseconds(1);
  config.chunk_timeout = kMaxChunkTimeout;
  EXPECT_TRUE(validate_transfer_config(config, 4095, error)) << error;
  config.chunk_timeout = kMaxChunkTimeout + std::chrono::milliseconds(1);
  EXPECT_FALSE(validate_transfer_config(config, 4095, error));
}

}  // namespace otalink::ota::tests
