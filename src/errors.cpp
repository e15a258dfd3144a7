#include "errors.hpp"

#include <utility>

namespace deskbridge {

const char* ErrorKindName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "None";
    case ErrorCode::kParseError:
      return "ParseError";
    case ErrorCode::kInvalidRequest:
      return "InvalidRequest";
    case ErrorCode::kMethodNotFound:
      return "MethodNotFound";
    case ErrorCode::kValidationError:
      return "ValidationError";
    case ErrorCode::kInternalError:
      return "InternalError";
    case ErrorCode::kExecutionError:
      return "ExecutionError";
    case ErrorCode::kToolNotFound:
      return "ToolNotFound";
    case ErrorCode::kTimeoutError:
      return "TimeoutError";
    case ErrorCode::kSessionInvalid:
      return "SessionInvalid";
    case ErrorCode::kSessionExpired:
      return "SessionExpired";
    case ErrorCode::kLockConflict:
      return "LockConflict";
    case ErrorCode::kPathTranslationError:
      return "PathTranslationError";
    case ErrorCode::kStaleMailboxItem:
      return "StaleMailboxItem";
  }
  return "Unknown";
}

int JsonRpcCode(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return 0;
    case ErrorCode::kParseError:
      return -32700;
    case ErrorCode::kInvalidRequest:
      return -32600;
    case ErrorCode::kMethodNotFound:
      return -32601;
    case ErrorCode::kValidationError:
      return -32602;
    case ErrorCode::kInternalError:
      return -32603;
    case ErrorCode::kExecutionError:
      return -32000;
    case ErrorCode::kToolNotFound:
      return -32001;
    case ErrorCode::kTimeoutError:
      return -32002;
    case ErrorCode::kSessionInvalid:
      return -32010;
    case ErrorCode::kSessionExpired:
      return -32011;
    case ErrorCode::kLockConflict:
      return -32020;
    case ErrorCode::kPathTranslationError:
      return -32021;
    case ErrorCode::kStaleMailboxItem:
      return -32022;
  }
  return -32603;
}

bool Fail(GatewayError* err, ErrorCode code, std::string message, nlohmann::json data) {
  if (err) {
    err->code = code;
    err->message = std::move(message);
    err->data = std::move(data);
  }
  return false;
}

nlohmann::json ErrorToJson(const GatewayError& err) {
  nlohmann::json data = err.data.is_object() ? err.data : nlohmann::json::object();
  if (!err.data.is_null() && !err.data.is_object()) data["detail"] = err.data;
  data["kind"] = ErrorKindName(err.code);
  nlohmann::json j;
  j["code"] = JsonRpcCode(err.code);
  j["message"] = err.message.empty() ? std::string(ErrorKindName(err.code)) : err.message;
  j["data"] = std::move(data);
  return j;
}

}  // namespace deskbridge
