#include "VortexException.hpp"

namespace vortex {
string errorTypeName(VortexErrorType type) {
  switch (type) {
    case VortexErrorType::INVALID_PACKET:
      return "InvalidPacket";
    case VortexErrorType::INVALID_LENGTH:
      return "InvalidLength";
    case VortexErrorType::INVALID_VALUE:
      return "InvalidValue";
    case VortexErrorType::INVALID_ARGUMENT:
      return "InvalidArgument";
  }
  return "Unknown";
}
}  // namespace vortex
