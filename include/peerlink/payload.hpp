/**
 * @file payload.hpp
 * @brief Byte-stream sources attached to packets for side-channel transfer.
 */

#ifndef PEERLINK_PAYLOAD_HPP_
#define PEERLINK_PAYLOAD_HPP_

#include "peerlink/platform.hpp"
#include "peerlink/vocabulary.hpp"

#include <cstring>
#include <string>

namespace peerlink {

enum class PayloadError : uint8_t {
  kSizeMismatch = 0,
  kIo,
  kClosed,
};

// ============================================================================
// Payload - abstract byte source
// ============================================================================

/**
 * @brief Sequential byte source of known size.
 *
 * Read() returns 0 at end of stream. Close() is idempotent and is also
 * performed by the destructor of every implementation.
 */
class Payload {
 public:
  virtual ~Payload() = default;

  virtual expected<size_t, PayloadError> Read(void* buf, size_t len) = 0;
  virtual int64_t Size() const noexcept = 0;
  virtual void Close() noexcept = 0;

  /**
   * @brief Drain the remaining bytes into a string.
   * @return Content, or the first error reported by Read().
   */
  expected<std::string, PayloadError> ReadAll() {
    std::string out;
    char buf[4096];
    for (;;) {
      auto r = Read(buf, sizeof(buf));
      if (!r.has_value()) {
        return expected<std::string, PayloadError>::error(r.get_error());
      }
      if (r.value() == 0U) break;
      out.append(buf, r.value());
    }
    return expected<std::string, PayloadError>::success(std::move(out));
  }
};

// ============================================================================
// BufferPayload - in-memory source
// ============================================================================

class BufferPayload final : public Payload {
 public:
  explicit BufferPayload(std::string data) : data_(std::move(data)) {}

  expected<size_t, PayloadError> Read(void* buf, size_t len) override {
    if (closed_) return expected<size_t, PayloadError>::error(PayloadError::kClosed);
    size_t n = data_.size() - offset_;
    if (n > len) n = len;
    std::memcpy(buf, data_.data() + offset_, n);
    offset_ += n;
    return expected<size_t, PayloadError>::success(n);
  }

  int64_t Size() const noexcept override {
    return static_cast<int64_t>(data_.size());
  }

  void Close() noexcept override { closed_ = true; }

 private:
  std::string data_;
  size_t offset_ = 0;
  bool closed_ = false;
};

}  // namespace peerlink

#endif  // PEERLINK_PAYLOAD_HPP_
