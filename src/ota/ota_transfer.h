#pragma once

#include <cstdint>
#include <span>

#include "ota/transfer_driver.h"
#include "transport/isotp/segmentation_transport.h"

namespace otalink::ota {

// Open a transport through the connector with config.flow_control applied,
// transfer the payload, and close the transport on every exit path. A close
// failure is logged and flagged in teardown_failed without changing success.
TransferResult transfer_payload(std::span<const std::uint8_t> payload,
                                transport::TransportConnector& connector,
                                const TransferConfig& config,
                                TransferDriver::ProgressHandler progress = nullptr);

}  // namespace otalink::ota
