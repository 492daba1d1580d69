#pragma once

#include <string>

namespace gribscan {

/**
 * @brief Status codes for GRIB scanners, caches and readers.
 */
enum class StatusCode {
  Success = 0,
  NotOpen,
  OpenFailed,
  ReadFailed,
  WriteFailed,
  TruncatedMessage,
  InvalidMessage,
  CacheMiss,
  OutOfRange,
  NoDecoder,
  DecodeFailed,
  KeyNotFound,
  MissingKey,
  InvalidValueType,
  MissingValues,
  ShapeMismatch,
  NoMessages,
  NotUnique,
};

/**
 * @brief Wraps a status code and string message carrying additional context.
 */
struct [[nodiscard]] Status {
  StatusCode code;
  std::string message;

  Status()
      : code(StatusCode::Success) {}

  Status(StatusCode _code)
      : code(_code) {
    switch (code) {
      case StatusCode::Success:
        break;
      case StatusCode::NotOpen:
        message = "not open";
        break;
      case StatusCode::OpenFailed:
        message = "open failed";
        break;
      case StatusCode::ReadFailed:
        message = "read failed";
        break;
      case StatusCode::WriteFailed:
        message = "write failed";
        break;
      case StatusCode::TruncatedMessage:
        message = "truncated message";
        break;
      case StatusCode::InvalidMessage:
        message = "invalid message";
        break;
      case StatusCode::CacheMiss:
        message = "cache miss";
        break;
      case StatusCode::OutOfRange:
        message = "index out of range";
        break;
      case StatusCode::NoDecoder:
        message = "no decoder available";
        break;
      case StatusCode::DecodeFailed:
        message = "decode failed";
        break;
      case StatusCode::KeyNotFound:
        message = "key not found";
        break;
      case StatusCode::MissingKey:
        message = "required key missing";
        break;
      case StatusCode::InvalidValueType:
        message = "invalid value type";
        break;
      case StatusCode::MissingValues:
        message = "statistics with missing values not yet implemented";
        break;
      case StatusCode::ShapeMismatch:
        message = "grid shape mismatch";
        break;
      case StatusCode::NoMessages:
        message = "no messages";
        break;
      case StatusCode::NotUnique:
        message = "value is not unique";
        break;
      default:
        message = "unknown";
        break;
    }
  }

  Status(StatusCode _code, const std::string& _message)
      : code(_code)
      , message(_message) {}

  bool ok() const {
    return code == StatusCode::Success;
  }
};

}  // namespace gribscan
