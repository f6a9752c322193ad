#include "ByteUtils.hpp"

#include "VortexException.hpp"

namespace vortex {
void ByteUtils::ensureAvailable(const string& buffer, size_t offset,
                                size_t width) {
  // offset may be anything the caller computed, so avoid offset + width
  if (offset > buffer.size() || buffer.size() - offset < width) {
    throw VortexException(
        VortexErrorType::INVALID_PACKET,
        "cannot read " + to_string(width) + " bytes at offset " +
            to_string(offset) + " from a buffer of " +
            to_string(buffer.size()) + " bytes");
  }
}

uint8_t ByteUtils::readUint8(const string& buffer, size_t offset) {
  ensureAvailable(buffer, offset, 1);
  return uint8_t(buffer[offset]);
}

uint32_t ByteUtils::readUint32BigEndian(const string& buffer, size_t offset) {
  ensureAvailable(buffer, offset, 4);
  return (uint32_t(uint8_t(buffer[offset])) << 24) |
         (uint32_t(uint8_t(buffer[offset + 1])) << 16) |
         (uint32_t(uint8_t(buffer[offset + 2])) << 8) |
         uint32_t(uint8_t(buffer[offset + 3]));
}

void ByteUtils::appendUint8(string* out, uint8_t value) {
  out->push_back(char(value));
}

void ByteUtils::appendUint32BigEndian(string* out, uint32_t value) {
  out->push_back(char((value >> 24) & 0xFF));
  out->push_back(char((value >> 16) & 0xFF));
  out->push_back(char((value >> 8) & 0xFF));
  out->push_back(char(value & 0xFF));
}

string ByteUtils::toHex(const string& buffer) {
  static const char digits[] = "0123456789abcdef";
  string s(buffer.size() * 2, '\0');
  for (size_t i = 0; i < buffer.size(); ++i) {
    uint8_t b = uint8_t(buffer[i]);
    s[i * 2] = digits[b >> 4];
    s[i * 2 + 1] = digits[b & 0x0F];
  }
  return s;
}
}  // namespace vortex
