#include "Tag.hpp"

#include "VortexException.hpp"

namespace vortex {
Tag Tag::fromByte(uint8_t code) {
  switch (code) {
    case DOWNLOAD_PIECE_CODE:
      return downloadPiece();
    case PIECE_CONTENT_CODE:
      return pieceContent();
    case CLOSE_CODE:
      return close();
    case ERROR_CODE:
      return error();
    default:
      return Tag(TagType::RESERVED, code);
  }
}

Tag Tag::parse(const string& text) {
  string lowered = toLower(text);
  if (lowered == "downloadpiece" || lowered == "download_piece") {
    return downloadPiece();
  }
  if (lowered == "piececontent" || lowered == "piece_content") {
    return pieceContent();
  }
  if (lowered == "close") {
    return close();
  }
  if (lowered == "error") {
    return error();
  }

  if (!text.empty() && text.length() <= 3 &&
      text.find_first_not_of("0123456789") == string::npos) {
    int code = stoi(text);
    if (code <= 255) {
      return fromByte(uint8_t(code));
    }
  }
  throw VortexException(VortexErrorType::INVALID_ARGUMENT,
                        "unknown tag '" + text +
                            "', expected a tag name or a code in [0, 255]");
}

bool Tag::hasTypedPayload() const {
  switch (type) {
    case TagType::DOWNLOAD_PIECE:
    case TagType::PIECE_CONTENT:
    case TagType::ERROR:
      return true;
    case TagType::RESERVED:
    case TagType::CLOSE:
      return false;
  }
  return false;
}

string Tag::name() const {
  switch (type) {
    case TagType::DOWNLOAD_PIECE:
      return "DownloadPiece";
    case TagType::PIECE_CONTENT:
      return "PieceContent";
    case TagType::CLOSE:
      return "Close";
    case TagType::ERROR:
      return "Error";
    case TagType::RESERVED:
      break;
  }
  return "Reserved(" + to_string(int(code)) + ")";
}
}  // namespace vortex
