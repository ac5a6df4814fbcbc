/**
 * @file platform.hpp
 * @brief Assertion macro and protocol constants.
 */

#ifndef PEERLINK_PLATFORM_HPP_
#define PEERLINK_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace peerlink {

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "PEERLINK_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define PEERLINK_ASSERT(cond) ((void)0)
#else
#define PEERLINK_ASSERT(cond) \
  ((cond) ? ((void)0)         \
          : ::peerlink::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Protocol Constants
// ============================================================================

/// Protocol version spoken by this implementation.
static constexpr int32_t kProtocolVersion = 8;

/// First protocol version that re-exchanges identities over TLS.
static constexpr int32_t kSecureIdentityMinVersion = 8;

}  // namespace peerlink

#endif  // PEERLINK_PLATFORM_HPP_
