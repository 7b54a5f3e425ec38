#pragma once
#include <cstdint>
#include <string>

namespace sc {

enum class ErrorCode : std::uint8_t {
  None = 0,
  DuplicateId,
  NotFound,
  InvalidConfiguration,
  InsufficientComponents
};

inline const char* toString(ErrorCode c) {
  switch (c) {
    case ErrorCode::None: return "NONE";
    case ErrorCode::DuplicateId: return "DUPLICATE_ID";
    case ErrorCode::NotFound: return "NOT_FOUND";
    case ErrorCode::InvalidConfiguration: return "INVALID_CONFIGURATION";
    case ErrorCode::InsufficientComponents: return "INSUFFICIENT_COMPONENTS";
    default: return "UNKNOWN";
  }
}

struct OpError {
  ErrorCode code{ErrorCode::None};
  std::string message;  // human text
};

// Outcome of a fallible operation. A failed operation leaves state unchanged.
struct OpResult {
  bool ok{true};
  OpError err{};
};

inline OpResult opOk() { return {}; }

inline OpResult opFail(ErrorCode code, const std::string& message) {
  OpResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  return r;
}

} // namespace sc
