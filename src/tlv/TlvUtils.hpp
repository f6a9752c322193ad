#ifndef __VORTEX_TLV_UTILS__
#define __VORTEX_TLV_UTILS__

#include "Headers.hpp"

namespace vortex {
/**
 * @brief Parses an unsigned decimal that has exactly one textual form: digits
 * only, no sign, no leading zeros except for "0" itself.
 * @param field Name used in the error message.
 * @throws VortexException(INVALID_VALUE) if the text is not canonical or the
 * number is greater than maxValue.
 */
uint64_t parseCanonicalDecimal(const string& text, uint64_t maxValue,
                               const string& field);
}  // namespace vortex

#endif  // __VORTEX_TLV_UTILS__
