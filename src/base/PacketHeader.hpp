#ifndef __VORTEX_PACKET_HEADER__
#define __VORTEX_PACKET_HEADER__

#include "Headers.hpp"
#include "Tag.hpp"

namespace vortex {
/**
 * @brief The fixed prefix of every Vortex packet.
 *
 * Wire layout (big-endian):
 *
 *   offset 0  1 byte   packet id
 *   offset 1  1 byte   tag code
 *   offset 2  4 bytes  value length
 */
class PacketHeader {
 public:
  /** @brief Serialized size of a header in bytes. */
  static constexpr size_t SIZE = 6;

  PacketHeader(uint8_t _packetId, const Tag& _tag, uint32_t _length)
      : packetId(_packetId), tag(_tag), length(_length) {}

  /**
   * @brief Decodes the first SIZE bytes of the buffer.  Anything past them is
   * ignored.
   * @throws VortexException(INVALID_PACKET) if fewer than SIZE bytes exist.
   */
  static PacketHeader fromBytes(const string& bytes);

  /** @brief Always returns exactly SIZE bytes. */
  string toBytes() const;

  uint8_t getPacketId() const { return packetId; }
  const Tag& getTag() const { return tag; }
  uint32_t getLength() const { return length; }

  bool operator==(const PacketHeader& other) const {
    return packetId == other.packetId && tag == other.tag &&
           length == other.length;
  }
  bool operator!=(const PacketHeader& other) const {
    return !(*this == other);
  }

 protected:
  uint8_t packetId;
  Tag tag;
  uint32_t length;
};
}  // namespace vortex

#endif  // __VORTEX_PACKET_HEADER__
