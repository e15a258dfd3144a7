#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace deskbridge {

enum class ErrorCode {
  kNone = 0,
  kParseError,
  kInvalidRequest,
  kMethodNotFound,
  kValidationError,
  kInternalError,
  kExecutionError,
  kToolNotFound,
  kTimeoutError,
  kSessionInvalid,
  kSessionExpired,
  kLockConflict,
  kPathTranslationError,
  kStaleMailboxItem,
};

struct GatewayError {
  ErrorCode code = ErrorCode::kNone;
  std::string message;
  nlohmann::json data;

  bool ok() const { return code == ErrorCode::kNone; }
};

const char* ErrorKindName(ErrorCode code);
int JsonRpcCode(ErrorCode code);

// Fills *err when err is non-null. Always returns false so callers can
// `return Fail(err, ...)` from bool functions.
bool Fail(GatewayError* err, ErrorCode code, std::string message, nlohmann::json data = nullptr);

nlohmann::json ErrorToJson(const GatewayError& err);

}  // namespace deskbridge
