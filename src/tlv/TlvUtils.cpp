#include "TlvUtils.hpp"

#include "VortexException.hpp"

namespace vortex {
uint64_t parseCanonicalDecimal(const string& text, uint64_t maxValue,
                               const string& field) {
  if (text.empty()) {
    throw VortexException(VortexErrorType::INVALID_VALUE, field + " is empty");
  }
  if (text.find_first_not_of("0123456789") != string::npos) {
    throw VortexException(VortexErrorType::INVALID_VALUE,
                          field + " is not a decimal number: '" + text + "'");
  }
  if (text.length() > 1 && text[0] == '0') {
    throw VortexException(VortexErrorType::INVALID_VALUE,
                          field + " has leading zeros: '" + text + "'");
  }

  uint64_t result = 0;
  for (char c : text) {
    result = result * 10 + uint64_t(c - '0');
    if (result > maxValue) {
      throw VortexException(VortexErrorType::INVALID_VALUE,
                            field + " " + text + " exceeds " +
                                to_string(maxValue));
    }
  }
  return result;
}
}  // namespace vortex
