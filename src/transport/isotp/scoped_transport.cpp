#include "transport/isotp/scoped_transport.h"

#include "common/logging/logger.h"

namespace otalink::transport {

ScopedTransport::~ScopedTransport() {
  std::error_code ec;
  if (!release(ec)) {
    LOG_WARN("Error closing transport: {}", ec.message());
  }
}

bool ScopedTransport::release(std::error_code& ec) {
  if (!transport_) {
    return true;
  }
  auto transport = std::move(transport_);
  return transport->close(ec);
}

}  // namespace otalink::transport
