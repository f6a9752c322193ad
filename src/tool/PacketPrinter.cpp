#include "PacketPrinter.hpp"

#include "ByteUtils.hpp"
#include "base64.h"

namespace vortex {
json PacketPrinter::toJson(const Packet& packet) {
  json j;
  j["packet_id"] = int(packet.getPacketId());
  j["tag"] = packet.getTag().name();
  j["tag_code"] = int(packet.getTag().toByte());
  j["length"] = packet.length();

  json payload;
  switch (packet.getTag().getType()) {
    case TagType::DOWNLOAD_PIECE: {
      const DownloadPiece& downloadPiece = packet.getDownloadPiece();
      payload["task_id_base64"] = toBase64(downloadPiece.getTaskId());
      payload["piece_number"] = downloadPiece.getPieceNumber();
      break;
    }
    case TagType::PIECE_CONTENT:
      payload["content_base64"] =
          toBase64(packet.getPieceContent().getContent());
      break;
    case TagType::ERROR: {
      const ErrorPayload& error = packet.getError();
      payload["code"] = int(error.getCode());
      payload["code_name"] = errorCodeName(error.getCode());
      payload["message_base64"] = toBase64(error.getMessage());
      break;
    }
    case TagType::CLOSE:
    case TagType::RESERVED:
      payload["value_base64"] = toBase64(packet.getControlPayload().getValue());
      break;
  }
  j["payload"] = payload;
  return j;
}

string PacketPrinter::toText(const Packet& packet) {
  std::ostringstream ss;
  ss << "packet id: " << int(packet.getPacketId()) << endl
     << "tag: " << packet.getTag() << " (" << int(packet.getTag().toByte())
     << ")" << endl
     << "length: " << packet.length() << endl;

  switch (packet.getTag().getType()) {
    case TagType::DOWNLOAD_PIECE:
      ss << "task id: " << packet.getDownloadPiece().getTaskId() << endl
         << "piece number: " << packet.getDownloadPiece().getPieceNumber()
         << endl;
      break;
    case TagType::PIECE_CONTENT:
      ss << "content: " << hexPreview(packet.getPieceContent().getContent())
         << endl;
      break;
    case TagType::ERROR:
      ss << "error code: " << errorCodeName(packet.getError().getCode())
         << " (" << int(packet.getError().getCode()) << ")" << endl
         << "error message: " << packet.getError().getMessage() << endl;
      break;
    case TagType::CLOSE:
    case TagType::RESERVED:
      if (!packet.getControlPayload().getValue().empty()) {
        ss << "value: " << hexPreview(packet.getControlPayload().getValue())
           << endl;
      }
      break;
  }
  return ss.str();
}

string PacketPrinter::toBase64(const string& bytes) {
  string encoded;
  if (!Base64::Encode(bytes, &encoded)) {
    throw runtime_error("b64 encode failed");
  }
  return encoded;
}

string PacketPrinter::hexPreview(const string& bytes) {
  if (bytes.length() <= HEX_PREVIEW_BYTES) {
    return ByteUtils::toHex(bytes);
  }
  return ByteUtils::toHex(bytes.substr(0, HEX_PREVIEW_BYTES)) + "... (" +
         to_string(bytes.length()) + " bytes)";
}
}  // namespace vortex
