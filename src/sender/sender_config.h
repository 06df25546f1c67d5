#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

#include "ota/transfer_driver.h"
#include "transport/isotp/socketcan_isotp.h"

namespace otalink::sender {

// Configuration of the firmware sender tool.
struct SenderConfig {
  // General settings.
  std::string config_file;
  bool verbose{false};
  std::string log_file;

  // Firmware image to send.
  std::string firmware_path;

  // CAN interface and identifiers. rx_id is the identifier the target listens
  // on (we transmit on it), tx_id the one the target answers on.
  std::string interface{"vcan0"};
  std::uint32_t rx_id{0x7E0};
  std::uint32_t tx_id{0x7E8};
  bool extended_id{false};

  // ISO-TP flow control advertised to the target.
  unsigned int block_size{8};
  unsigned int stmin{0};
  unsigned int wft_max{0};

  // Transfer.
  std::size_t chunk_size{2048};
  double timeout_seconds{15.0};
  unsigned int poll_interval_ms{1};
};

// Parse command-line arguments into configuration. Loads the file named by
// --config, if any, after the command line; file values override.
bool parse_args(int argc, char* argv[], SenderConfig& config, std::error_code& ec);

// Load configuration from INI file.
bool load_config_file(const std::string& path, SenderConfig& config, std::error_code& ec);

// Validate configuration.
bool validate_config(const SenderConfig& config, std::string& error);

// Derive transport and transfer settings from a validated configuration.
transport::IsoTpEndpoint make_endpoint(const SenderConfig& config);
ota::TransferConfig make_transfer_config(const SenderConfig& config);

}  // namespace otalink::sender
