#include "ota/ota_transfer.h"

#include <chrono>
#include <memory>
#include <utility>

#include "common/logging/logger.h"
#include "transport/isotp/scoped_transport.h"

namespace otalink::ota {

TransferResult transfer_payload(std::span<const std::uint8_t> payload,
                                transport::TransportConnector& connector,
                                const TransferConfig& config,
                                TransferDriver::ProgressHandler progress) {
  std::error_code ec;
  auto opened = connector.open(config.flow_control, ec);
  if (!opened) {
    LOG_ERROR("ISO-TP transmission failed: could not open transport: {}", ec.message());
    TransferResult result;
    result.error = TransferError::kSetupFailed;
    result.ec = ec ? ec : std::make_error_code(std::errc::not_connected);
    return result;
  }

  transport::ScopedTransport transport(std::move(opened));
  TransferDriver driver(config);
  driver.set_progress_handler(std::move(progress));
  TransferResult result = driver.run(payload, transport.get());

  std::error_code close_ec;
  if (!transport.release(close_ec)) {
    LOG_WARN("Error closing transport: {}", close_ec.message());
    result.teardown_failed = true;
  }
  return result;
}

}  // namespace otalink::ota
