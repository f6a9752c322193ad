#include "PacketIdGenerator.hpp"

namespace vortex {
SodiumPacketIdGenerator::SodiumPacketIdGenerator() {
  if (-1 == sodium_init()) {
    STFATAL << "libsodium init failed";
  }
}

uint8_t SodiumPacketIdGenerator::next() {
  return uint8_t(randombytes_uniform(256));
}
}  // namespace vortex
