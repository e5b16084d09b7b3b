#include "errors.hpp"

const char* error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::TOPIC_TOO_LONG:
      return "TopicTooLong";
    case ErrorCode::BODY_TOO_LONG:
      return "BodyTooLong";
    case ErrorCode::PLAINTEXT_TOO_LARGE:
      return "PlaintextTooLarge";
    case ErrorCode::LENGTH_OUT_OF_RANGE:
      return "LengthOutOfRange";
    case ErrorCode::MALFORMED_TEXT:
      return "MalformedText";
    case ErrorCode::KEY_UNWRAP_FAILED:
      return "KeyUnwrapFailed";
    case ErrorCode::AUTHENTICATION_FAILED:
      return "AuthenticationFailed";
    case ErrorCode::MALFORMED_SECURE_BODY:
      return "MalformedSecureBody";
    case ErrorCode::INVALID_KEY:
      return "InvalidKey";
    case ErrorCode::CRYPTO_FAILURE:
      return "CryptoFailure";
    case ErrorCode::STORAGE_FAILURE:
      return "StorageFailure";
    case ErrorCode::CONFIG_INVALID:
      return "ConfigInvalid";
  }
  return "Unknown";
}

IpcError::IpcError(ErrorCode code, const std::string& msg) : std::runtime_error(std::string(error_code_name(code)) + ": " + msg), error_code(code) {}
