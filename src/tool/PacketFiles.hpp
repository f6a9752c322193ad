#ifndef __VORTEX_PACKET_FILES__
#define __VORTEX_PACKET_FILES__

#include "Headers.hpp"
#include "Packet.hpp"

namespace vortex {
/**
 * @brief Moves single packets between the codec and files on disk.  A packet
 * file holds the wire bytes of exactly one packet.
 */
class PacketFiles {
 public:
  /**
   * @brief Builds a packet and writes its wire bytes to `path`.
   * @return The packet that was written.
   */
  static Packet write(const string& path, const Tag& tag, const string& value,
                      const shared_ptr<PacketIdGenerator>& idGenerator);

  /**
   * @brief Reads and decodes the packet stored in `path`.
   * @throws std::runtime_error if the file cannot be read, VortexException
   * if its contents are not a valid packet.
   */
  static Packet read(const string& path);

  static string readFile(const string& path);
  static void writeFile(const string& path, const string& contents);
};
}  // namespace vortex

#endif  // __VORTEX_PACKET_FILES__
