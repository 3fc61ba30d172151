#include "common/result.hpp"

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::USAGE: return "usage";
    case ErrorKind::DECODE: return "decode";
    case ErrorKind::TRANSPORT: return "transport";
    case ErrorKind::REMOTE_REJECTED: return "remote_rejected";
    case ErrorKind::PROTOCOL_VIOLATION: return "protocol_violation";
  }
  return "unknown";
}

int ExitCodeFor(ErrorKind kind) {
  return kind == ErrorKind::USAGE ? 2 : 1;
}

std::string SignerError::ToString() const {
  std::string out = "[";
  out += ErrorKindName(kind);
  out += "]";
  if (!context.empty()) { out += " "; out += context; out += ":"; }
  out += " ";
  out += message;
  return out;
}
