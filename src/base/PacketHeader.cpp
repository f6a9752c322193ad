#include "PacketHeader.hpp"

#include "ByteUtils.hpp"
#include "VortexException.hpp"

namespace vortex {
PacketHeader PacketHeader::fromBytes(const string& bytes) {
  if (bytes.length() < SIZE) {
    throw VortexException(VortexErrorType::INVALID_PACKET,
                          "expected min " + to_string(SIZE) + " bytes, got " +
                              to_string(bytes.length()));
  }
  uint8_t packetId = ByteUtils::readUint8(bytes, 0);
  Tag tag = Tag::fromByte(ByteUtils::readUint8(bytes, 1));
  uint32_t length = ByteUtils::readUint32BigEndian(bytes, 2);
  return PacketHeader(packetId, tag, length);
}

string PacketHeader::toBytes() const {
  string s;
  s.reserve(SIZE);
  ByteUtils::appendUint8(&s, packetId);
  ByteUtils::appendUint8(&s, tag.toByte());
  ByteUtils::appendUint32BigEndian(&s, length);
  return s;
}
}  // namespace vortex
