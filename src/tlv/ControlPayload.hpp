#ifndef __VORTEX_CONTROL_PAYLOAD__
#define __VORTEX_CONTROL_PAYLOAD__

#include "Headers.hpp"

namespace vortex {
/**
 * @brief Value of a Close or Reserved packet.
 *
 * Nothing is interpreted, but the bytes are kept so a packet with a tag this
 * build does not know about still re-encodes exactly as it was received.
 * Usually empty.
 */
class ControlPayload {
 public:
  ControlPayload() {}
  explicit ControlPayload(const string& _value) : value(_value) {}

  static ControlPayload fromBytes(const string& value) {
    return ControlPayload(value);
  }
  string toBytes() const { return value; }

  const string& getValue() const { return value; }

  bool operator==(const ControlPayload& other) const {
    return value == other.value;
  }
  bool operator!=(const ControlPayload& other) const {
    return !(*this == other);
  }

 protected:
  string value;
};
}  // namespace vortex

#endif  // __VORTEX_CONTROL_PAYLOAD__
