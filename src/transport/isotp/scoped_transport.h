#pragma once

#include <memory>
#include <system_error>
#include <utility>

#include "transport/isotp/segmentation_transport.h"

namespace otalink::transport {

// Owns an open transport for the duration of a transfer and closes it on
// every exit path. release() closes explicitly and reports the outcome; the
// destructor closes whatever is still held and only logs a failure.
class ScopedTransport {
 public:
  explicit ScopedTransport(std::unique_ptr<SegmentationTransport> transport)
      : transport_(std::move(transport)) {}
  ~ScopedTransport();

  ScopedTransport(const ScopedTransport&) = delete;
  ScopedTransport& operator=(const ScopedTransport&) = delete;
  ScopedTransport(ScopedTransport&&) = default;
  ScopedTransport& operator=(ScopedTransport&&) = delete;

  SegmentationTransport& get() { return *transport_; }
  explicit operator bool() const { return transport_ != nullptr; }

  // Close and drop the transport. Returns false with ec set when closing fails;
  // the transport is dropped either way.
  bool release(std::error_code& ec);

 private:
  std::unique_ptr<SegmentationTransport> transport_;
};

}  // namespace otalink::transport
