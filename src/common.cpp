#include "kefctl/types.h"

#include "internal.h"

#include <exception>
#include <iostream>
#include <utility>

namespace kefctl {

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarning:
      return "warning";
    case LogLevel::kError:
      return "error";
  }
  return "unknown";
}

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "None";
    case ErrorCode::kNoHostConfigured:
      return "NoHostConfigured";
    case ErrorCode::kTransportError:
      return "TransportError";
    case ErrorCode::kMalformedResponse:
      return "MalformedResponse";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kCancelled:
      return "Cancelled";
    case ErrorCode::kNoDeviceFound:
      return "NoDeviceFound";
    case ErrorCode::kInvalidInput:
      return "InvalidInput";
  }
  return "Unknown";
}

std::string Error::ToString() const {
  std::string text = ErrorCodeName(code);
  if (!message.empty()) {
    text += ": ";
    text += message;
  }
  return text;
}

std::string DeviceAddress::ToString() const {
  if (!port.has_value()) {
    return host;
  }
  return host + ":" + std::to_string(port.value());
}

bool operator==(const DeviceAddress& a, const DeviceAddress& b) {
  return a.host == b.host && a.port == b.port;
}

bool operator!=(const DeviceAddress& a, const DeviceAddress& b) {
  return !(a == b);
}

bool operator==(const PlaybackInfo& a, const PlaybackInfo& b) {
  return a.title == b.title && a.artist == b.artist && a.album == b.album &&
         a.album_art == b.album_art && a.duration == b.duration &&
         a.position == b.position && a.state == b.state;
}

namespace internal {

void Log(const LogCallback& callback, LogLevel level, const std::string& message) {
  if (callback) {
    try {
      callback(level, message);
      return;
    } catch (const std::exception& ex) {
      std::cerr << "[kefctl] log callback threw exception: " << ex.what()
                << std::endl;
    }
  }
  std::cerr << "[kefctl] " << LogLevelName(level) << ": " << message << std::endl;
}

bool Fail(Error* error, ErrorCode code, std::string message) {
  if (error) {
    error->code = code;
    error->message = std::move(message);
  }
  return false;
}

}  // namespace internal
}  // namespace kefctl
