#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

#include "common/logging/logger.h"
#include "common/version.h"
#include "ota/ota_transfer.h"
#include "sender/sender_config.h"
#include "transport/isotp/socketcan_isotp.h"

using namespace otalink;

namespace {

bool load_firmware(const std::string& path, std::vector<std::uint8_t>& image,
                   std::error_code& ec) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    ec = errno != 0 ? std::error_code(errno, std::generic_category())
                    : std::make_error_code(std::errc::no_such_file_or_directory);
    return false;
  }
  const std::streamsize size = file.tellg();
  if (size < 0) {
    ec = std::make_error_code(std::errc::io_error);
    return false;
  }
  if (static_cast<std::uint64_t>(size) > std::numeric_limits<std::uint32_t>::max()) {
    ec = std::make_error_code(std::errc::file_too_large);
    return false;
  }
  image.resize(static_cast<std::size_t>(size));
  file.seekg(0, std::ios::beg);
  if (size > 0 && !file.read(reinterpret_cast<char*>(image.data()), size)) {
    ec = std::make_error_code(std::errc::io_error);
    return false;
  }
  return true;
}

std::string format_firmware_error(const std::string& path, const std::error_code& ec) {
  std::string msg = "Firmware file '" + path + "' error: " + ec.message();
  if (ec == std::errc::no_such_file_or_directory) {
    msg += "\n  Check the path passed with --firmware.";
  } else if (ec == std::errc::permission_denied) {
    msg += "\n  Ensure the file is readable by the current user.";
  } else if (ec == std::errc::file_too_large) {
    msg += "\n  The OTA header can describe images of at most 4 GiB - 1 bytes.";
  }
  return msg;
}

void log_configuration(const sender::SenderConfig& config) {
  LOG_INFO("Configuration:");
  LOG_INFO("  CAN Interface: {}", config.interface);
  LOG_INFO("  RX ID: 0x{:X}", config.rx_id);
  LOG_INFO("  TX ID: 0x{:X}", config.tx_id);
  LOG_INFO("  Chunk Size: {} bytes", config.chunk_size);
  LOG_INFO("  Block Size: {}", config.block_size);
  LOG_INFO("  ST Min: {}", config.stmin);
  LOG_INFO("  Timeout: {}s", config.timeout_seconds);
}

void print_progress(const ota::ChunkProgress& progress) {
  const double percent =
      progress.total_bytes == 0
          ? 100.0
          : 100.0 * static_cast<double>(progress.bytes_sent) /
                static_cast<double>(progress.total_bytes);
  std::cout << "[" << progress.chunk_index << "] " << progress.chunk_size << " bytes, "
            << progress.bytes_sent << "/" << progress.total_bytes << " (" << static_cast<int>(percent)
            << "%)" << '\n';
}

}  // namespace

int main(int argc, char* argv[]) {
  sender::SenderConfig config;
  std::error_code ec;

  if (!sender::parse_args(argc, argv, config, ec)) {
    if (ec == std::errc::operation_canceled) {
      return EXIT_SUCCESS;  // --help / --version
    }
    std::cerr << "Failed to parse arguments: " << ec.message() << '\n';
    return EXIT_FAILURE;
  }

  std::string validation_error;
  if (!sender::validate_config(config, validation_error)) {
    std::cerr << "Configuration error: " << validation_error << '\n';
    return EXIT_FAILURE;
  }

  logging::configure_logging(config.verbose ? logging::LogLevel::debug : logging::LogLevel::info,
                             true, config.log_file);
  LOG_INFO("{} starting", kFullVersionString);

  std::vector<std::uint8_t> firmware;
  if (!load_firmware(config.firmware_path, firmware, ec)) {
    LOG_ERROR("{}", format_firmware_error(config.firmware_path, ec));
    return EXIT_FAILURE;
  }
  LOG_INFO("Loaded firmware: {} ({} bytes)", config.firmware_path, firmware.size());
  log_configuration(config);

  LOG_INFO("Starting ISO-TP OTA transmission...");
  transport::SocketCanConnector connector(sender::make_endpoint(config));
  const ota::TransferResult result =
      ota::transfer_payload(firmware, connector, sender::make_transfer_config(config),
                            print_progress);

  if (!result.success) {
    if (result.failed_chunk != 0) {
      LOG_ERROR("Firmware transmission failed at chunk {}: {} ({})", result.failed_chunk,
                ota::to_string(result.error), result.ec.message());
    } else {
      LOG_ERROR("Firmware transmission failed: {} ({})", ota::to_string(result.error),
                result.ec.message());
    }
    return EXIT_FAILURE;
  }

  LOG_INFO("Firmware transmission completed successfully: {} chunks, {} bytes in {:.2f}s",
           result.chunks_sent, result.bytes_sent,
           std::chrono::duration<double>(result.elapsed).count());
  if (result.teardown_failed) {
    LOG_WARN("CAN interface was not released cleanly");
  }
  LOG_INFO("Device should now restart with the new firmware.");
  return EXIT_SUCCESS;
}
