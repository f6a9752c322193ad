#ifndef __VORTEX_PACKET_H__
#define __VORTEX_PACKET_H__

#include "ControlPayload.hpp"
#include "DownloadPiece.hpp"
#include "ErrorPayload.hpp"
#include "Headers.hpp"
#include "PacketHeader.hpp"
#include "PacketIdGenerator.hpp"
#include "PieceContent.hpp"
#include "Tag.hpp"

namespace vortex {
/**
 * @brief A single Vortex packet: a PacketHeader plus the typed payload its
 * tag calls for.
 *
 * Packets are immutable values.  They come from create() (new outgoing
 * packet, fresh id) or fromBytes() (received packet, id from the wire), and
 * leave through toBytes().  Both ways in produce equal packets for equal
 * content.
 */
class Packet {
 public:
  /**
   * @brief Typed value of a packet.  Close and Reserved tags use
   * ControlPayload.
   */
  typedef std::variant<DownloadPiece, PieceContent, ErrorPayload,
                       ControlPayload>
      Payload;

  /** @brief Largest value the 32 bit length field can describe. */
  static constexpr uint64_t MAX_VALUE_SIZE = 0xFFFFFFFFull;

  /**
   * @brief Builds a new packet with an id drawn from idGenerator.
   *
   * The value length is checked before the id is drawn, so a rejected value
   * consumes no id.
   * @throws VortexException INVALID_LENGTH for an oversized value, or the
   * payload parser's INVALID_VALUE for a malformed one.
   */
  static Packet create(const Tag& tag, const string& value,
                       const shared_ptr<PacketIdGenerator>& idGenerator);

  /**
   * @brief Decodes exactly one packet from a complete buffer.
   *
   * Safe on arbitrary input: every failure is a VortexException.
   */
  static Packet fromBytes(const string& bytes);

  /**
   * @throws VortexException(INVALID_LENGTH) if a value of this many bytes
   * cannot be carried by a packet.
   */
  static void checkValueLength(uint64_t valueLength);

  /**
   * @brief Serializes the header and payload into the wire format.
   * @return PacketHeader::SIZE + length() bytes.
   */
  string toBytes() const;

  uint8_t getPacketId() const { return header.getPacketId(); }
  const Tag& getTag() const { return header.getTag(); }
  /** @brief Length of the value field in bytes. */
  uint32_t length() const { return header.getLength(); }
  const PacketHeader& getHeader() const { return header; }
  const Payload& getPayload() const { return payload; }

  /**
   * Typed payload accessors.
   * @throws VortexException(INVALID_ARGUMENT) if the packet holds a different
   * payload kind.
   */
  const DownloadPiece& getDownloadPiece() const;
  const PieceContent& getPieceContent() const;
  const ErrorPayload& getError() const;
  const ControlPayload& getControlPayload() const;

  bool operator==(const Packet& other) const {
    return header == other.header && payload == other.payload;
  }
  bool operator!=(const Packet& other) const { return !(*this == other); }

 protected:
  Packet(const PacketHeader& _header, Payload&& _payload)
      : header(_header), payload(std::move(_payload)) {}

  /** @brief Hands the value to the parser that matches the tag. */
  static Payload parsePayload(const Tag& tag, const string& value);

  template <typename T>
  const T& getTypedPayload(const char* kind) const;

  PacketHeader header;
  Payload payload;
};

std::ostream& operator<<(std::ostream& os, const Packet& packet);
}  // namespace vortex

#endif  // __VORTEX_PACKET_H__
