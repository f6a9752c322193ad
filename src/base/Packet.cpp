#include "Packet.hpp"

#include "VortexException.hpp"

namespace vortex {
Packet Packet::create(const Tag& tag, const string& value,
                      const shared_ptr<PacketIdGenerator>& idGenerator) {
  checkValueLength(value.length());
  if (idGenerator.get() == NULL) {
    throw VortexException(VortexErrorType::INVALID_ARGUMENT,
                          "no packet id generator supplied");
  }

  PacketHeader header(idGenerator->next(), tag, uint32_t(value.length()));
  return Packet(header, parsePayload(tag, value));
}

Packet Packet::fromBytes(const string& bytes) {
  // Also rejects buffers shorter than a header
  PacketHeader header = PacketHeader::fromBytes(bytes);

  uint64_t valueLength = bytes.length() - PacketHeader::SIZE;
  if (valueLength != header.getLength()) {
    throw VortexException(VortexErrorType::INVALID_LENGTH,
                          "value len " + to_string(valueLength) +
                              " != declared length " +
                              to_string(header.getLength()));
  }

  VLOG(4) << "Decoding " << header.getTag() << " packet "
          << int(header.getPacketId()) << " with " << valueLength
          << " value bytes";
  return Packet(header, parsePayload(header.getTag(),
                                     bytes.substr(PacketHeader::SIZE)));
}

void Packet::checkValueLength(uint64_t valueLength) {
  if (valueLength > MAX_VALUE_SIZE) {
    throw VortexException(VortexErrorType::INVALID_LENGTH,
                          "value len " + to_string(valueLength) +
                              " exceeds max value size " +
                              to_string(MAX_VALUE_SIZE));
  }
}

Packet::Payload Packet::parsePayload(const Tag& tag, const string& value) {
  switch (tag.getType()) {
    case TagType::DOWNLOAD_PIECE:
      return DownloadPiece::fromBytes(value);
    case TagType::PIECE_CONTENT:
      return PieceContent::fromBytes(value);
    case TagType::ERROR:
      return ErrorPayload::fromBytes(value);
    case TagType::CLOSE:
    case TagType::RESERVED:
      return ControlPayload::fromBytes(value);
  }
  throw VortexException(VortexErrorType::INVALID_PACKET,
                        "unhandled tag " + tag.name());
}

string Packet::toBytes() const {
  string value =
      std::visit([](const auto& typed) { return typed.toBytes(); }, payload);
  PacketHeader wireHeader(header.getPacketId(), header.getTag(),
                          uint32_t(value.length()));
  string s = wireHeader.toBytes();
  s.reserve(PacketHeader::SIZE + value.length());
  s.append(value);
  return s;
}

template <typename T>
const T& Packet::getTypedPayload(const char* kind) const {
  const T* typed = std::get_if<T>(&payload);
  if (typed == NULL) {
    throw VortexException(VortexErrorType::INVALID_ARGUMENT,
                          string("packet with tag ") + getTag().name() +
                              " has no " + kind + " payload");
  }
  return *typed;
}

const DownloadPiece& Packet::getDownloadPiece() const {
  return getTypedPayload<DownloadPiece>("download piece");
}

const PieceContent& Packet::getPieceContent() const {
  return getTypedPayload<PieceContent>("piece content");
}

const ErrorPayload& Packet::getError() const {
  return getTypedPayload<ErrorPayload>("error");
}

const ControlPayload& Packet::getControlPayload() const {
  return getTypedPayload<ControlPayload>("control");
}

std::ostream& operator<<(std::ostream& os, const Packet& packet) {
  os << "Packet(id=" << int(packet.getPacketId())
     << ", tag=" << packet.getTag() << ", length=" << packet.length() << ")";
  return os;
}
}  // namespace vortex
