#include "sender/sender_config.h"

#include <net/if.h>

#include <cerrno>
#include <chrono>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <CLI/CLI.hpp>

#include "common/logging/logger.h"
#include "common/version.h"
#include "ota/ota_header.h"
#include "transport/isotp/socketcan_isotp.h"

namespace otalink::sender {

namespace {
constexpr std::uint32_t kMaxStandardId = 0x7FF;
constexpr std::uint32_t kMaxExtendedId = 0x1FFFFFFF;
constexpr double kMaxTimeoutSeconds =
    static_cast<double>(std::chrono::seconds(ota::kMaxChunkTimeout).count());

// Helper to safely parse integer with validation. Accepts 0x/0 prefixes.
template <typename T>
bool safe_parse_int(const std::string& value, T& out, const std::string& field_name,
                    std::error_code& ec) {
  static_assert(std::is_unsigned_v<T>, "configuration integers are unsigned");
  try {
    if (!value.empty() && value[0] == '-') {
      LOG_ERROR("Configuration error: {} value '{}' cannot be negative", field_name, value);
      ec = std::make_error_code(std::errc::result_out_of_range);
      return false;
    }
    std::size_t consumed = 0;
    const unsigned long long parsed = std::stoull(value, &consumed, 0);
    if (consumed != value.size()) {
      LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
      ec = std::make_error_code(std::errc::invalid_argument);
      return false;
    }
    if (parsed > std::numeric_limits<T>::max()) {
      LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
      ec = std::make_error_code(std::errc::result_out_of_range);
      return false;
    }
    out = static_cast<T>(parsed);
    return true;
  } catch (const std::invalid_argument&) {
    LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  } catch (const std::out_of_range&) {
    LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
    ec = std::make_error_code(std::errc::result_out_of_range);
    return false;
  }
}

bool safe_parse_double(const std::string& value, double& out, const std::string& field_name,
                       std::error_code& ec) {
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(value, &consumed);
    if (consumed != value.size()) {
      LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
      ec = std::make_error_code(std::errc::invalid_argument);
      return false;
    }
    out = parsed;
    return true;
  } catch (const std::invalid_argument&) {
    LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  } catch (const std::out_of_range&) {
    LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
    ec = std::make_error_code(std::errc::result_out_of_range);
    return false;
  }
}

bool parse_bool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

bool parse_ini_value(const std::string& line, std::string& key, std::string& value) {
  if (line.empty() || line[0] == '#' || line[0] == ';') {
    return false;
  }
  if (line[0] == '[') {
    return false;
  }

  auto pos = line.find('=');
  if (pos == std::string::npos) {
    return false;
  }

  key = line.substr(0, pos);
  value = line.substr(pos + 1);

  while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) {
    key.pop_back();
  }
  while (!key.empty() && (key.front() == ' ' || key.front() == '\t')) {
    key.erase(0, 1);
  }
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) {
    value.pop_back();
  }
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.erase(0, 1);
  }

  return !key.empty();
}

std::string get_current_section(const std::string& line) {
  std::string trimmed = line;
  while (!trimmed.empty() && (trimmed.back() == '\r' || trimmed.back() == ' ')) {
    trimmed.pop_back();
  }
  if (trimmed.size() >= 2 && trimmed.front() == '[' && trimmed.back() == ']') {
    return trimmed.substr(1, trimmed.size() - 2);
  }
  return "";
}

// STmin values 0x80-0xF0 and 0xFA-0xFF are reserved by ISO 15765-2.
bool is_valid_stmin(unsigned int stmin) {
  return stmin <= 0x7F || (stmin >= 0xF1 && stmin <= 0xF9);
}
}  // namespace

bool parse_args(int argc, char* argv[], SenderConfig& config, std::error_code& ec) {
  CLI::App app{"Send a firmware image over ISO-TP (CAN) for OTA update"};
  app.set_version_flag("--version", kFullVersionString);

  // General options.
  app.add_option("-c,--config", config.config_file, "Configuration file path");
  app.add_flag("-v,--verbose", config.verbose, "Enable verbose logging");
  app.add_option("--log-file", config.log_file, "Log file path");

  // Firmware.
  app.add_option("-f,--firmware", config.firmware_path, "Path to firmware binary file");

  // CAN.
  app.add_option("-i,--interface", config.interface, "CAN interface name")->default_val("vcan0");
  app.add_option("--rx-id", config.rx_id, "CAN ID the target receives on (hex accepted)")
      ->default_str("0x7E0");
  app.add_option("--tx-id", config.tx_id, "CAN ID the target transmits on (hex accepted)")
      ->default_str("0x7E8");
  app.add_flag("--extended-id", config.extended_id, "Use 29-bit CAN identifiers");

  // ISO-TP flow control.
  app.add_option("--blocksize", config.block_size, "ISO-TP block size")->default_val(8);
  app.add_option("--stmin", config.stmin, "ISO-TP separation time minimum")->default_val(0);
  app.add_option("--wftmax", config.wft_max, "ISO-TP maximum wait frames (0 disables)")
      ->default_val(0);

  // Transfer.
  app.add_option("--chunk-size", config.chunk_size, "Data chunk size in bytes")
      ->default_val(2048);
  app.add_option("--timeout", config.timeout_seconds, "Per-chunk transmission timeout in seconds")
      ->default_val(15.0);
  app.add_option("--poll-interval-ms", config.poll_interval_ms,
                 "Delay between transport steps while a chunk drains")
      ->default_val(1);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    const int exit_code = app.exit(e);
    ec = exit_code == 0 ? std::make_error_code(std::errc::operation_canceled)
                        : std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  // Load config file if specified.
  if (!config.config_file.empty()) {
    if (!load_config_file(config.config_file, config, ec)) {
      return false;
    }
  }

  return true;
}

bool load_config_file(const std::string& path, SenderConfig& config, std::error_code& ec) {
  std::ifstream file(path);
  if (!file) {
    ec = errno != 0 ? std::error_code(errno, std::generic_category())
                    : std::make_error_code(std::errc::no_such_file_or_directory);
    LOG_ERROR("Failed to open config file: {}", path);
    return false;
  }

  std::string line;
  std::string section;

  while (std::getline(file, line)) {
    std::string new_section = get_current_section(line);
    if (!new_section.empty()) {
      section = new_section;
      continue;
    }

    std::string key;
    std::string value;
    if (!parse_ini_value(line, key, value)) {
      continue;
    }

    if (section == "general" || section.empty()) {
      if (key == "verbose") {
        config.verbose = parse_bool(value);
      } else if (key == "log_file") {
        config.log_file = value;
      } else if (key == "firmware") {
        config.firmware_path = value;
      }
    } else if (section == "can") {
      if (key == "interface") {
        config.interface = value;
      } else if (key == "rx_id") {
        if (!safe_parse_int(value, config.rx_id, "rx_id", ec)) {
          return false;
        }
      } else if (key == "tx_id") {
        if (!safe_parse_int(value, config.tx_id, "tx_id", ec)) {
          return false;
        }
      } else if (key == "extended_id") {
        config.extended_id = parse_bool(value);
      }
    } else if (section == "isotp") {
      if (key == "blocksize") {
        if (!safe_parse_int(value, config.block_size, "blocksize", ec)) {
          return false;
        }
      } else if (key == "stmin") {
        if (!safe_parse_int(value, config.stmin, "stmin", ec)) {
          return false;
        }
      } else if (key == "wftmax") {
        if (!safe_parse_int(value, config.wft_max, "wftmax", ec)) {
          return false;
        }
      }
    } else if (section == "transfer") {
      if (key == "chunk_size") {
        if (!safe_parse_int(value, config.chunk_size, "chunk_size", ec)) {
          return false;
        }
      } else if (key == "timeout") {
        if (!safe_parse_double(value, config.timeout_seconds, "timeout", ec)) {
          return false;
        }
      } else if (key == "poll_interval_ms") {
        if (!safe_parse_int(value, config.poll_interval_ms, "poll_interval_ms", ec)) {
          return false;
        }
      }
    } else {
      LOG_DEBUG("Ignoring key {} in unknown section [{}]", key, section);
    }
  }

  LOG_DEBUG("Loaded configuration from {}", path);
  return true;
}

bool validate_config(const SenderConfig& config, std::string& error) {
  if (config.firmware_path.empty()) {
    error = "Firmware path is required";
    return false;
  }

  if (config.interface.empty()) {
    error = "CAN interface is required";
    return false;
  }
  if (config.interface.size() >= IFNAMSIZ) {
    error = "CAN interface name is too long: " + config.interface;
    return false;
  }

  const std::uint32_t max_id = config.extended_id ? kMaxExtendedId : kMaxStandardId;
  if (config.rx_id > max_id || config.tx_id > max_id) {
    error = config.extended_id ? "CAN IDs must fit in 29 bits" : "CAN IDs must fit in 11 bits";
    return false;
  }
  if (config.rx_id == config.tx_id) {
    error = "RX and TX CAN IDs must differ";
    return false;
  }

  if (config.block_size > 0xFF) {
    error = "Block size must be between 0 and 255";
    return false;
  }
  if (config.stmin > 0xFF || !is_valid_stmin(config.stmin)) {
    error = "STmin must be 0-127 (ms) or 0xF1-0xF9 (100-900 us)";
    return false;
  }
  if (config.wft_max > 0xFF) {
    error = "Maximum wait frames must be between 0 and 255";
    return false;
  }

  if (config.chunk_size < ota::kHeaderSize ||
      config.chunk_size > transport::SocketCanIsoTp::kMaxUnitSize) {
    error = "Chunk size must be between " + std::to_string(ota::kHeaderSize) + " and " +
            std::to_string(transport::SocketCanIsoTp::kMaxUnitSize);
    return false;
  }

  if (!std::isfinite(config.timeout_seconds) || config.timeout_seconds <= 0.0) {
    error = "Timeout must be a positive number of seconds";
    return false;
  }
  if (config.timeout_seconds * 1000.0 < 1.0) {
    error = "Timeout must be at least 1 ms";
    return false;
  }
  if (config.timeout_seconds > kMaxTimeoutSeconds) {
    error = "Timeout must not exceed " + std::to_string(ota::kMaxChunkTimeout.count()) +
            " hours (" + std::to_string(static_cast<long long>(kMaxTimeoutSeconds)) + " s)";
    return false;
  }

  if (config.poll_interval_ms == 0) {
    error = "Poll interval must be at least 1 ms";
    return false;
  }

  return true;
}

transport::IsoTpEndpoint make_endpoint(const SenderConfig& config) {
  transport::IsoTpEndpoint endpoint;
  endpoint.interface = config.interface;
  // We transmit on the target's RX identifier and listen on its TX identifier.
  endpoint.tx_id = config.rx_id;
  endpoint.rx_id = config.tx_id;
  endpoint.extended_id = config.extended_id;
  return endpoint;
}

ota::TransferConfig make_transfer_config(const SenderConfig& config) {
  ota::TransferConfig transfer;
  transfer.max_chunk_size = config.chunk_size;
  transfer.flow_control.block_size = static_cast<std::uint8_t>(config.block_size);
  transfer.flow_control.stmin = static_cast<std::uint8_t>(config.stmin);
  transfer.flow_control.wft_max = static_cast<std::uint8_t>(config.wft_max);
  // Round up so a fractional millisecond never shortens the timeout.
  transfer.chunk_timeout = std::chrono::milliseconds(
      static_cast<std::int64_t>(std::ceil(config.timeout_seconds * 1000.0)));
  transfer.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
  return transfer;
}

}  // namespace otalink::sender
