#ifndef __VORTEX_PACKET_PRINTER__
#define __VORTEX_PACKET_PRINTER__

#include "Headers.hpp"
#include "Packet.hpp"
#include "nlohmann/json.hpp"

namespace vortex {
using json = nlohmann::json;

/**
 * @brief Renders decoded packets for humans and scripts.
 */
class PacketPrinter {
 public:
  /**
   * @brief JSON form.  Opaque bytes (piece content, control values, error
   * messages) are base64 encoded so the output is always valid UTF-8.
   */
  static json toJson(const Packet& packet);

  /** @brief Multi-line "field: value" summary. */
  static string toText(const Packet& packet);

  /** @brief Bytes shown in hex by toText() before truncating. */
  static constexpr size_t HEX_PREVIEW_BYTES = 32;

 private:
  static string toBase64(const string& bytes);
  static string hexPreview(const string& bytes);
};
}  // namespace vortex

#endif  // __VORTEX_PACKET_PRINTER__
