#pragma once
// Error taxonomy shared by the envelope codec, cipher, key store and config.
//
// Every failure is thrown as `IpcError` (a std::runtime_error) carrying a
// stable `ErrorCode`. Bounds and decoding errors are recoverable by the
// caller; crypto errors are recoverable per message.
#include <stdexcept>
#include <string>

enum class ErrorCode {
  // bounds violations
  TOPIC_TOO_LONG,
  BODY_TOO_LONG,
  PLAINTEXT_TOO_LARGE,
  LENGTH_OUT_OF_RANGE,
  // decoding violations
  MALFORMED_TEXT,
  // cryptographic violations
  KEY_UNWRAP_FAILED,
  AUTHENTICATION_FAILED,
  MALFORMED_SECURE_BODY,
  // setup / environment
  INVALID_KEY,
  CRYPTO_FAILURE,
  STORAGE_FAILURE,
  CONFIG_INVALID
};

// Stable identifier for a code, e.g. "TopicTooLong".
const char* error_code_name(ErrorCode code);

class IpcError : public std::runtime_error {
  ErrorCode error_code;

public:
  IpcError(ErrorCode code, const std::string& msg);
  ErrorCode code() const {
    return error_code;
  }
};
