/**
 * @file tls.hpp
 * @brief OpenSSL session layer on top of net::TcpClient.
 *
 * The handshake runs blocking with a socket timeout. Afterwards the socket is
 * switched to non-blocking mode: SSL_read / SSL_write share the SSL object
 * under one mutex and wait with poll(2) outside of it, so a pending read never
 * blocks a concurrent write. Close() shuts the socket down, which wakes any
 * waiting reader.
 *
 * Peer verification is done after the handshake: with a pinned certificate
 * the presented certificate must be identical, otherwise it is captured.
 */

#ifndef PEERLINK_TLS_HPP_
#define PEERLINK_TLS_HPP_

#include "peerlink/certificate.hpp"
#include "peerlink/net.hpp"
#include "peerlink/platform.hpp"
#include "peerlink/vocabulary.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>

#ifndef PEERLINK_TLS_HANDSHAKE_TIMEOUT_MS
#define PEERLINK_TLS_HANDSHAKE_TIMEOUT_MS 10000
#endif

namespace peerlink {

enum class TlsError : uint8_t {
  kContextFailed = 0,
  kHandshakeFailed,
  kNoPeerCertificate,
  kCertificateMismatch,
  kIoFailed,
  kClosed,
  kLineTooLong,
  kTimeout,
};

inline const char* TlsErrorName(TlsError e) noexcept {
  switch (e) {
    case TlsError::kContextFailed:       return "context failed";
    case TlsError::kHandshakeFailed:     return "handshake failed";
    case TlsError::kNoPeerCertificate:   return "no peer certificate";
    case TlsError::kCertificateMismatch: return "certificate mismatch";
    case TlsError::kIoFailed:            return "io failed";
    case TlsError::kClosed:              return "closed";
    case TlsError::kLineTooLong:         return "line too long";
    case TlsError::kTimeout:             return "timeout";
    default:                             return "unknown";
  }
}

/** @brief Which end of the TLS handshake this side plays. */
enum class TlsRole : uint8_t {
  kClient = 0,
  kServer,
};

// ============================================================================
// TlsContext
// ============================================================================

/**
 * @brief SSL_CTX holding the local certificate and key. TLS 1.2 minimum.
 * Shared by all sessions; non-copyable.
 */
class TlsContext {
 public:
  static expected<std::shared_ptr<TlsContext>, TlsError> Create(
      const Certificate& cert, const PrivateKey& key) {
    using R = expected<std::shared_ptr<TlsContext>, TlsError>;
    SSL_CTX* ctx = SSL_CTX_new(TLS_method());
    if (ctx == nullptr) return R::error(TlsError::kContextFailed);
    std::shared_ptr<TlsContext> self(new TlsContext(ctx));
    if (SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION) != 1 ||
        SSL_CTX_use_certificate(ctx, cert.get()) != 1 ||
        SSL_CTX_use_PrivateKey(ctx, key.get()) != 1 ||
        SSL_CTX_check_private_key(ctx) != 1) {
      return R::error(TlsError::kContextFailed);
    }
    SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE |
                              SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    // Close() ends a session with a TCP FIN only; read that as kClosed.
    SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
    return R::success(std::move(self));
  }

  ~TlsContext() { SSL_CTX_free(ctx_); }

  TlsContext(const TlsContext&) = delete;
  TlsContext& operator=(const TlsContext&) = delete;

  SSL_CTX* get() const noexcept { return ctx_; }

 private:
  explicit TlsContext(SSL_CTX* ctx) noexcept : ctx_(ctx) {}

  SSL_CTX* ctx_;
};

// ============================================================================
// TlsStream
// ============================================================================

/** @brief Verification policy for one handshake. */
struct TlsPeerPolicy {
  /// When non-empty, the peer must present exactly this certificate.
  Certificate pinned;
  /// Server side: abort the handshake if the client sends no certificate.
  bool require_client_cert = false;
};

namespace detail {

// Certificates are self-signed; chain validation is replaced by pinning after
// the handshake.
inline int AcceptAnyCertificate(int /*preverify_ok*/,
                                X509_STORE_CTX* /*ctx*/) {
  return 1;
}

inline void SetSocketTimeout(int fd, int32_t timeout_ms) noexcept {
  timeval tv{};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

inline bool SetNonBlocking(int fd) noexcept {
  int flags = ::fcntl(fd, F_GETFL, 0);
  return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

}  // namespace detail

/**
 * @brief Established TLS session over a TCP connection.
 *
 * Thread-safe for one concurrent reader plus any number of writers.
 */
class TlsStream {
 public:
  /**
   * @brief Run the handshake on @p sock in @p role.
   * @return Stream on success; kHandshakeFailed, kNoPeerCertificate or
   *         kCertificateMismatch otherwise. The socket is closed on failure.
   */
  static expected<std::shared_ptr<TlsStream>, TlsError> Handshake(
      const std::shared_ptr<TlsContext>& ctx, net::TcpClient&& sock,
      TlsRole role, const TlsPeerPolicy& policy,
      int32_t timeout_ms = PEERLINK_TLS_HANDSHAKE_TIMEOUT_MS) {
    using R = expected<std::shared_ptr<TlsStream>, TlsError>;
    SSL* ssl = SSL_new(ctx->get());
    if (ssl == nullptr) {
      sock.Close();
      return R::error(TlsError::kContextFailed);
    }
    std::shared_ptr<TlsStream> stream(
        new TlsStream(ctx, std::move(sock), ssl, role));
    const int fd = stream->sock_.Fd();

    int verify = SSL_VERIFY_PEER;
    if (role == TlsRole::kServer && policy.require_client_cert) {
      verify |= SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
    }
    SSL_set_verify(ssl, verify, &detail::AcceptAnyCertificate);
    if (SSL_set_fd(ssl, fd) != 1) return R::error(TlsError::kContextFailed);

    detail::SetSocketTimeout(fd, timeout_ms);
    ERR_clear_error();
    int rc = (role == TlsRole::kClient) ? SSL_connect(ssl) : SSL_accept(ssl);
    if (rc != 1) {
      stream->Close();
      return R::error(TlsError::kHandshakeFailed);
    }

#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    X509* peer = SSL_get1_peer_certificate(ssl);
#else
    X509* peer = SSL_get_peer_certificate(ssl);
#endif
    if (peer == nullptr) {
      stream->Close();
      return R::error(TlsError::kNoPeerCertificate);
    }
    stream->peer_cert_ = Certificate(peer);
    if (!policy.pinned.Empty() && policy.pinned != stream->peer_cert_) {
      stream->Close();
      return R::error(TlsError::kCertificateMismatch);
    }

    if (!detail::SetNonBlocking(fd)) {
      stream->Close();
      return R::error(TlsError::kIoFailed);
    }
    stream->peer_host_ = stream->sock_.PeerHost();
    return R::success(std::move(stream));
  }

  ~TlsStream() {
    Close();
    SSL_free(ssl_);
  }

  TlsStream(const TlsStream&) = delete;
  TlsStream& operator=(const TlsStream&) = delete;

  /**
   * @brief Read up to @p len bytes, blocking until at least one arrives.
   * @return Bytes read; 0 never returned (EOF is TlsError::kClosed).
   */
  expected<size_t, TlsError> Read(void* buf, size_t len) {
    if (!rbuf_.empty()) {
      size_t n = (rbuf_.size() < len) ? rbuf_.size() : len;
      std::memcpy(buf, rbuf_.data(), n);
      rbuf_.erase(0, n);
      return expected<size_t, TlsError>::success(n);
    }
    return ReadSome(buf, len, -1);
  }

  /**
   * @brief Read one '\n'-terminated line (newline included).
   * @param max_len Upper bound on the line length
   * @param timeout_ms Overall limit (negative = none)
   */
  expected<std::string, TlsError> ReadLine(size_t max_len,
                                           int32_t timeout_ms = -1) {
    using R = expected<std::string, TlsError>;
    const int64_t deadline = (timeout_ms < 0) ? -1 : NowMs() + timeout_ms;
    for (;;) {
      size_t pos = rbuf_.find('\n');
      if (pos != std::string::npos) {
        std::string line = rbuf_.substr(0, pos + 1);
        rbuf_.erase(0, pos + 1);
        return R::success(std::move(line));
      }
      if (rbuf_.size() >= max_len) return R::error(TlsError::kLineTooLong);
      char chunk[4096];
      auto n = ReadSome(chunk, sizeof(chunk), deadline);
      if (!n.has_value()) return R::error(n.get_error());
      rbuf_.append(chunk, n.value());
    }
  }

  /** @brief Write the whole buffer. */
  expected<void, TlsError> WriteAll(const void* data, size_t len) {
    const char* p = static_cast<const char*>(data);
    while (len > 0U) {
      if (closed_.load(std::memory_order_acquire)) {
        return expected<void, TlsError>::error(TlsError::kClosed);
      }
      int rc = 0;
      int err = SSL_ERROR_NONE;
      {
        std::lock_guard<std::mutex> lock(io_mutex_);
        ERR_clear_error();
        rc = SSL_write(ssl_, p, static_cast<int>(len > kMaxChunk ? kMaxChunk : len));
        if (rc <= 0) err = SSL_get_error(ssl_, rc);
      }
      if (rc > 0) {
        p += rc;
        len -= static_cast<size_t>(rc);
        continue;
      }
      if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) {
        if (Wait(err == SSL_ERROR_WANT_WRITE ? POLLOUT : POLLIN, -1) <= 0) {
          return expected<void, TlsError>::error(TlsError::kClosed);
        }
      } else {
        return expected<void, TlsError>::error(TlsError::kIoFailed);
      }
    }
    return expected<void, TlsError>::success();
  }

  expected<void, TlsError> WriteAll(const std::string& data) {
    return WriteAll(data.data(), data.size());
  }

  /** @brief Shut the socket down; idempotent. Wakes blocked readers. */
  void Close() noexcept {
    if (!closed_.exchange(true, std::memory_order_acq_rel)) {
      sock_.Shutdown();
    }
  }

  bool IsClosed() const noexcept {
    return closed_.load(std::memory_order_acquire);
  }

  const Certificate& PeerCertificate() const noexcept { return peer_cert_; }
  const std::string& PeerHost() const noexcept { return peer_host_; }
  TlsRole Role() const noexcept { return role_; }

  const char* CipherName() const noexcept {
    const char* name = SSL_get_cipher_name(ssl_);
    return (name != nullptr) ? name : "unknown";
  }

 private:
  static constexpr size_t kMaxChunk = 16384;
  static constexpr int32_t kPollSliceMs = 250;

  TlsStream(std::shared_ptr<TlsContext> ctx, net::TcpClient&& sock, SSL* ssl,
            TlsRole role) noexcept
      : ctx_(std::move(ctx)), sock_(std::move(sock)), ssl_(ssl), role_(role) {}

  static int64_t NowMs() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
  }

  // deadline_ms: steady clock instant, negative = none.
  expected<size_t, TlsError> ReadSome(void* buf, size_t len,
                                      int64_t deadline_ms) {
    for (;;) {
      if (closed_.load(std::memory_order_acquire)) {
        return expected<size_t, TlsError>::error(TlsError::kClosed);
      }
      int rc = 0;
      int err = SSL_ERROR_NONE;
      {
        std::lock_guard<std::mutex> lock(io_mutex_);
        ERR_clear_error();
        rc = SSL_read(ssl_, buf, static_cast<int>(len > kMaxChunk ? kMaxChunk : len));
        if (rc <= 0) err = SSL_get_error(ssl_, rc);
      }
      if (rc > 0) {
        return expected<size_t, TlsError>::success(static_cast<size_t>(rc));
      }
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        int ready =
            Wait(err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline_ms);
        if (ready == 0) {
          return expected<size_t, TlsError>::error(TlsError::kTimeout);
        }
        if (ready < 0) break;
      } else if (err == SSL_ERROR_ZERO_RETURN) {
        break;
      } else {
        return expected<size_t, TlsError>::error(
            closed_.load(std::memory_order_acquire) ? TlsError::kClosed
                                                    : TlsError::kIoFailed);
      }
    }
    return expected<size_t, TlsError>::error(TlsError::kClosed);
  }

  // 1 = ready, 0 = deadline passed, -1 = closed or socket error.
  int Wait(short events, int64_t deadline_ms) noexcept {
    for (;;) {
      if (closed_.load(std::memory_order_acquire)) return -1;
      int32_t slice = kPollSliceMs;
      if (deadline_ms >= 0) {
        const int64_t left = deadline_ms - NowMs();
        if (left <= 0) return 0;
        if (left < slice) slice = static_cast<int32_t>(left);
      }
      int rc = net::detail::PollFd(sock_.Fd(), events, slice);
      if (rc > 0) return 1;
      if (rc < 0) return -1;
    }
  }

  std::shared_ptr<TlsContext> ctx_;
  net::TcpClient sock_;
  SSL* ssl_;
  TlsRole role_;
  std::atomic<bool> closed_{false};
  std::mutex io_mutex_;
  std::string rbuf_;  // only touched by the reading thread
  Certificate peer_cert_;
  std::string peer_host_;
};

}  // namespace peerlink

#endif  // PEERLINK_TLS_HPP_
