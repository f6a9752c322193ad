#include "ErrorPayload.hpp"

#include "TlvUtils.hpp"
#include "VortexException.hpp"

namespace vortex {
string errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::UNKNOWN:
      return "Unknown";
    case ErrorCode::INVALID_ARGUMENT:
      return "InvalidArgument";
    case ErrorCode::NOT_FOUND:
      return "NotFound";
    case ErrorCode::INTERNAL:
      return "Internal";
  }
  return "Reserved(" + to_string(int(code)) + ")";
}

ErrorPayload ErrorPayload::fromBytes(const string& value) {
  auto separatorPos = value.find(SEPARATOR);
  if (separatorPos == string::npos) {
    throw VortexException(VortexErrorType::INVALID_VALUE,
                          "error value has no '" + string(1, SEPARATOR) +
                              "' separator");
  }
  uint64_t code = parseCanonicalDecimal(value.substr(0, separatorPos),
                                        numeric_limits<uint8_t>::max(),
                                        "error code");
  return ErrorPayload(ErrorCode(uint8_t(code)),
                      value.substr(separatorPos + 1));
}

string ErrorPayload::toBytes() const {
  return to_string(int(code)) + SEPARATOR + message;
}
}  // namespace vortex
