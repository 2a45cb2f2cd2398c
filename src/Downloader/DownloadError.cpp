#include "DownloadError.hpp"

namespace parfetch {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE:
      return "None";
    case ErrorKind::VALIDATION:
      return "ValidationError";
    case ErrorKind::NETWORK:
      return "NetworkError";
    case ErrorKind::PROTOCOL:
      return "ProtocolError";
    case ErrorKind::DISK:
      return "DiskError";
    case ErrorKind::INCOMPLETE_TRANSFER:
      return "IncompleteTransferError";
    case ErrorKind::INTEGRITY:
      return "IntegrityError";
    case ErrorKind::CANCELLED:
      return "Cancelled";
    default:
      return "Unknown";
  }
}

}  // namespace parfetch
