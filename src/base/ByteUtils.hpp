#ifndef __VORTEX_BYTE_UTILS__
#define __VORTEX_BYTE_UTILS__

#include "Headers.hpp"

namespace vortex {
/**
 * @brief Bounds-checked fixed width integer access on byte strings.
 *
 * All multi-byte values are big-endian (network order).  Readers throw a
 * VortexException(INVALID_PACKET) instead of touching memory past the end
 * of the buffer.
 */
class ByteUtils {
 public:
  static uint8_t readUint8(const string& buffer, size_t offset);
  static uint32_t readUint32BigEndian(const string& buffer, size_t offset);

  static void appendUint8(string* out, uint8_t value);
  static void appendUint32BigEndian(string* out, uint32_t value);

  /**
   * @brief Renders bytes as lowercase hex, for logging and debugging.
   */
  static string toHex(const string& buffer);

 private:
  static void ensureAvailable(const string& buffer, size_t offset,
                              size_t width);
};
}  // namespace vortex

#endif  // __VORTEX_BYTE_UTILS__
