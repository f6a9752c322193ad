#ifndef __VORTEX_TAG__
#define __VORTEX_TAG__

#include "Headers.hpp"

namespace vortex {
/** @brief Requests one piece of a task from a peer. */
const uint8_t DOWNLOAD_PIECE_CODE = 0;
/** @brief Carries the bytes of a requested piece. */
const uint8_t PIECE_CONTENT_CODE = 1;
/** @brief Closes the exchange, no payload is interpreted. */
const uint8_t CLOSE_CODE = 254;
/** @brief Reports a failure as "<code>:<message>". */
const uint8_t ERROR_CODE = 255;

/**
 * @brief The closed set of tag variants.  RESERVED covers every code that is
 * not assigned to one of the others.
 */
enum class TagType {
  DOWNLOAD_PIECE = 0,
  PIECE_CONTENT = 1,
  RESERVED = 2,
  CLOSE = 3,
  ERROR = 4
};

/**
 * @brief Classifies the value of a packet by its tag byte.
 *
 * The byte to tag mapping is total, so any byte read off the wire becomes a
 * Tag.  Reserved tags keep their original code so they can be re-encoded
 * unchanged.
 */
class Tag {
 public:
  static Tag downloadPiece() {
    return Tag(TagType::DOWNLOAD_PIECE, DOWNLOAD_PIECE_CODE);
  }
  static Tag pieceContent() {
    return Tag(TagType::PIECE_CONTENT, PIECE_CONTENT_CODE);
  }
  static Tag close() { return Tag(TagType::CLOSE, CLOSE_CODE); }
  static Tag error() { return Tag(TagType::ERROR, ERROR_CODE); }

  /** @brief Maps a wire byte to its variant.  Never fails. */
  static Tag fromByte(uint8_t code);

  /**
   * @brief Parses a user supplied tag, either a variant name (any case) or a
   * decimal code in [0, 255].
   * @throws VortexException(INVALID_ARGUMENT) on anything else.
   */
  static Tag parse(const string& text);

  TagType getType() const { return type; }
  uint8_t toByte() const { return code; }
  bool isReserved() const { return type == TagType::RESERVED; }

  /**
   * @brief True for the tags whose value is handed to a payload parser
   * rather than kept as opaque bytes.
   */
  bool hasTypedPayload() const;

  /** @brief "DownloadPiece", "Close", "Reserved(42)" and so on. */
  string name() const;

  bool operator==(const Tag& other) const {
    return type == other.type && code == other.code;
  }
  bool operator!=(const Tag& other) const { return !(*this == other); }

 protected:
  Tag(TagType _type, uint8_t _code) : type(_type), code(_code) {}

  TagType type;
  /** @brief Wire code, fixed for the known variants. */
  uint8_t code;
};

inline std::ostream& operator<<(std::ostream& os, const Tag& tag) {
  os << tag.name();
  return os;
}
}  // namespace vortex

namespace std {
template <>
struct hash<vortex::Tag> {
  size_t operator()(const vortex::Tag& tag) const {
    // The code alone identifies the variant because the mapping is total
    return std::hash<uint8_t>()(tag.toByte());
  }
};
}  // namespace std

#endif  // __VORTEX_TAG__
