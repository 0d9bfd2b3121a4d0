#pragma once
#include <cstdint>
#include <string>

namespace lc {

enum class ErrorCode : std::uint8_t {
  None = 0,
  UnsupportedOperation, // transform requested on a non-transformable document
  DecodeError,          // reported by the decoder collaborator
  InvalidConfiguration, // e.g. non-positive viewport size (clamped, never fatal)
  NoDocument            // command needs an active document
};

inline const char* toString(ErrorCode c) {
  switch (c) {
    case ErrorCode::None: return "NONE";
    case ErrorCode::UnsupportedOperation: return "UNSUPPORTED_OPERATION";
    case ErrorCode::DecodeError: return "DECODE_ERROR";
    case ErrorCode::InvalidConfiguration: return "INVALID_CONFIGURATION";
    case ErrorCode::NoDocument: return "NO_DOCUMENT";
    default: return "UNKNOWN";
  }
}

struct ViewerError {
  ErrorCode code{ErrorCode::None};
  std::string message;
};

struct OpResult {
  bool ok{true};
  ViewerError err{};

  static OpResult success() { return OpResult{}; }

  static OpResult fail(ErrorCode code, const std::string& message) {
    OpResult r;
    r.ok = false;
    r.err.code = code;
    r.err.message = message;
    return r;
  }
};

} // namespace lc
