#ifndef __VORTEX_PACKET_ID_GENERATOR__
#define __VORTEX_PACKET_ID_GENERATOR__

#include "Headers.hpp"

namespace vortex {
/**
 * @brief Source of packet identifiers.
 *
 * Ids are correlation tokens only: they carry no ordering and may repeat.
 * Implementations must be safe to call from several threads at once.
 */
class PacketIdGenerator {
 public:
  virtual ~PacketIdGenerator() {}

  /** @brief Returns the id for the next packet. */
  virtual uint8_t next() = 0;
};

/**
 * @brief Draws uniformly random ids from libsodium's CSPRNG.
 */
class SodiumPacketIdGenerator : public PacketIdGenerator {
 public:
  /** @brief Initializes libsodium (idempotent, thread-safe). */
  SodiumPacketIdGenerator();

  virtual uint8_t next();
};
}  // namespace vortex

#endif  // __VORTEX_PACKET_ID_GENERATOR__
