#ifndef __VORTEX_DOWNLOAD_PIECE__
#define __VORTEX_DOWNLOAD_PIECE__

#include "Headers.hpp"

namespace vortex {
/**
 * @brief Asks a peer for one piece of a task.
 *
 * Wire form is ASCII "<task_id>-<piece_number>".  The task id cannot contain
 * '-' and the piece number is an unsigned 32 bit decimal without sign or
 * leading zeros, so every accepted value re-encodes to the same bytes.
 */
class DownloadPiece {
 public:
  DownloadPiece(const string& _taskId, uint32_t _pieceNumber);

  /**
   * @brief Parses the value of a DownloadPiece packet.
   * @throws VortexException(INVALID_VALUE) if the value is malformed.
   */
  static DownloadPiece fromBytes(const string& value);
  string toBytes() const;

  const string& getTaskId() const { return taskId; }
  uint32_t getPieceNumber() const { return pieceNumber; }

  bool operator==(const DownloadPiece& other) const {
    return taskId == other.taskId && pieceNumber == other.pieceNumber;
  }
  bool operator!=(const DownloadPiece& other) const {
    return !(*this == other);
  }

  static constexpr char SEPARATOR = '-';

 protected:
  string taskId;
  uint32_t pieceNumber;
};
}  // namespace vortex

#endif  // __VORTEX_DOWNLOAD_PIECE__
