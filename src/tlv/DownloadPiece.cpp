#include "DownloadPiece.hpp"

#include "TlvUtils.hpp"
#include "VortexException.hpp"

namespace vortex {
DownloadPiece::DownloadPiece(const string& _taskId, uint32_t _pieceNumber)
    : taskId(_taskId), pieceNumber(_pieceNumber) {
  if (taskId.empty() || taskId.find(SEPARATOR) != string::npos) {
    throw VortexException(VortexErrorType::INVALID_VALUE,
                          "task id must be non-empty and free of '" +
                              string(1, SEPARATOR) + "': '" + taskId + "'");
  }
}

DownloadPiece DownloadPiece::fromBytes(const string& value) {
  auto separatorPos = value.find(SEPARATOR);
  if (separatorPos == string::npos) {
    throw VortexException(VortexErrorType::INVALID_VALUE,
                          "download piece value has no '" +
                              string(1, SEPARATOR) + "' separator");
  }
  if (separatorPos == 0) {
    throw VortexException(VortexErrorType::INVALID_VALUE,
                          "download piece value has an empty task id");
  }

  string pieceNumberText = value.substr(separatorPos + 1);
  uint64_t pieceNumber = parseCanonicalDecimal(
      pieceNumberText, numeric_limits<uint32_t>::max(), "piece number");
  return DownloadPiece(value.substr(0, separatorPos), uint32_t(pieceNumber));
}

string DownloadPiece::toBytes() const {
  return taskId + SEPARATOR + to_string(pieceNumber);
}
}  // namespace vortex
