#ifndef __VORTEX_PIECE_CONTENT__
#define __VORTEX_PIECE_CONTENT__

#include "Headers.hpp"

namespace vortex {
/**
 * @brief The bytes of a piece, carried without interpretation.
 */
class PieceContent {
 public:
  explicit PieceContent(const string& _content) : content(_content) {}

  static PieceContent fromBytes(const string& value) {
    return PieceContent(value);
  }
  string toBytes() const { return content; }

  const string& getContent() const { return content; }

  bool operator==(const PieceContent& other) const {
    return content == other.content;
  }
  bool operator!=(const PieceContent& other) const {
    return !(*this == other);
  }

 protected:
  string content;
};
}  // namespace vortex

#endif  // __VORTEX_PIECE_CONTENT__
