#ifndef __VORTEX_EXCEPTION__
#define __VORTEX_EXCEPTION__

#include "Headers.hpp"

namespace vortex {
/**
 * @brief Classifies why a packet could not be built or parsed.
 */
enum class VortexErrorType {
  /** @brief Structural damage: short buffer or a bad integer conversion. */
  INVALID_PACKET = 0,
  /** @brief Declared length disagrees with the value, or exceeds the cap. */
  INVALID_LENGTH = 1,
  /** @brief A payload parser rejected the value bytes for its tag. */
  INVALID_VALUE = 2,
  /** @brief The caller asked for something the codec cannot provide. */
  INVALID_ARGUMENT = 3
};

/** @brief Printable name of an error type, e.g. "InvalidLength". */
string errorTypeName(VortexErrorType type);

/**
 * @brief Thrown for every recoverable codec failure.
 *
 * what() is prefixed with the error type so log lines stay self describing.
 */
class VortexException : public std::exception {
 public:
  VortexException(VortexErrorType _type, const string& _details)
      : type(_type),
        details(_details),
        message(errorTypeName(_type) + ": " + _details) {}

  const char* what() const noexcept override { return message.c_str(); }

  VortexErrorType getType() const { return type; }
  /** @brief Message without the type prefix. */
  const string& getDetails() const { return details; }

 private:
  VortexErrorType type;
  string details;
  string message;
};
}  // namespace vortex

#endif  // __VORTEX_EXCEPTION__
