#ifndef __VORTEX_ERROR_PAYLOAD__
#define __VORTEX_ERROR_PAYLOAD__

#include "Headers.hpp"

namespace vortex {
/**
 * @brief Error codes a peer may report.  Codes outside the named ones are
 * kept as-is.
 */
enum class ErrorCode : uint8_t {
  UNKNOWN = 0,
  INVALID_ARGUMENT = 1,
  NOT_FOUND = 2,
  INTERNAL = 3
};

/** @brief "NotFound" for named codes, "Reserved(9)" for the rest. */
string errorCodeName(ErrorCode code);

/**
 * @brief Value of an Error packet, encoded as ASCII "<code>:<message>".
 *
 * The message is everything after the first ':' and may itself contain ':'.
 */
class ErrorPayload {
 public:
  ErrorPayload(ErrorCode _code, const string& _message)
      : code(_code), message(_message) {}

  /**
   * @throws VortexException(INVALID_VALUE) when the separator is missing or
   * the code is not a canonical decimal in [0, 255].
   */
  static ErrorPayload fromBytes(const string& value);
  string toBytes() const;

  ErrorCode getCode() const { return code; }
  const string& getMessage() const { return message; }

  bool operator==(const ErrorPayload& other) const {
    return code == other.code && message == other.message;
  }
  bool operator!=(const ErrorPayload& other) const {
    return !(*this == other);
  }

  static constexpr char SEPARATOR = ':';

 protected:
  ErrorCode code;
  string message;
};
}  // namespace vortex

#endif  // __VORTEX_ERROR_PAYLOAD__
