#ifndef __FAKE_PACKET_ID_GENERATOR_HPP__
#define __FAKE_PACKET_ID_GENERATOR_HPP__

#include "PacketIdGenerator.hpp"

namespace vortex {
/**
 * @brief Hands out start, start + 1, ... and counts how many ids were drawn.
 */
class FakePacketIdGenerator : public PacketIdGenerator {
 public:
  explicit FakePacketIdGenerator(uint8_t start = 0)
      : nextId(start), drawCount(0) {}

  virtual ~FakePacketIdGenerator() {}

  virtual uint8_t next() {
    lock_guard<std::mutex> guard(generatorMutex);
    drawCount++;
    return nextId++;
  }

  int getDrawCount() {
    lock_guard<std::mutex> guard(generatorMutex);
    return drawCount;
  }

 protected:
  uint8_t nextId;
  int drawCount;
  std::mutex generatorMutex;
};
}  // namespace vortex

#endif  // __FAKE_PACKET_ID_GENERATOR_HPP__
