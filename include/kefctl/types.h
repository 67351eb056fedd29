#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace kefctl {

/**
 * Well-known ports and addresses used by the speaker and by SSDP.
 */
constexpr uint16_t kDefaultHttpPort = 80;
constexpr uint16_t kSsdpPort = 1900;
constexpr const char* kSsdpMulticastAddress = "239.255.255.250";

/**
 * Volume range accepted by the speaker.
 */
constexpr int kMinVolume = 0;
constexpr int kMaxVolume = 100;

/**
 * Severity passed to log callbacks.
 */
enum class LogLevel {
  kInfo,
  kWarning,
  kError,
};

using LogCallback = std::function<void(LogLevel, const std::string&)>;

/// Return a lowercase name for a log level ("info", "warning", "error").
const char* LogLevelName(LogLevel level);

/**
 * Error categories reported by discovery, the transport and the controller.
 */
enum class ErrorCode {
  kNone,
  kNoHostConfigured,
  kTransportError,
  kMalformedResponse,
  kTimeout,
  kCancelled,
  kNoDeviceFound,
  kInvalidInput,
};

/// Return a stable name for an error code (e.g. "TransportError").
const char* ErrorCodeName(ErrorCode code);

/**
 * Typed error filled by operations that accept an `Error*` out-parameter.
 */
struct Error {
  ErrorCode code = ErrorCode::kNone;
  std::string message;

  bool ok() const { return code == ErrorCode::kNone; }
  /// "Name: message" or just the name when no message is set.
  std::string ToString() const;
};

/**
 * Network location of a speaker as produced by discovery.
 */
struct DeviceAddress {
  /// IPv4 address in dotted form.
  std::string host;
  /// Optional HTTP port; the configured default is used when unset.
  std::optional<uint16_t> port;

  /// "host" or "host:port".
  std::string ToString() const;
  bool empty() const { return host.empty(); }
};

bool operator==(const DeviceAddress& a, const DeviceAddress& b);
bool operator!=(const DeviceAddress& a, const DeviceAddress& b);

/**
 * Now-playing information reported by `player:player/data`.
 */
struct PlaybackInfo {
  std::string title;
  std::string artist;
  std::string album;
  /// Album art reference (icon URL from the track roles).
  std::string album_art;
  /// Track duration as reported by the speaker (milliseconds).
  int duration = 0;
  int position = 0;
  /// Play state string ("playing", "paused", "stopped", ...).
  std::string state;
};

bool operator==(const PlaybackInfo& a, const PlaybackInfo& b);

/**
 * Snapshot of everything the controller knows about the connected speaker.
 */
struct DeviceState {
  std::string address;
  uint16_t port = kDefaultHttpPort;
  bool connected = false;
  /// Last known volume (0-100).
  int volume = 0;
  /// Last known playback info, if it has been fetched at least once.
  std::optional<PlaybackInfo> playback;
  bool powered_on = false;
  /// Text of the most recent failure, empty after a successful connect.
  std::string last_error;
  /// Model parsed from the firmware release text (e.g. "LSXII").
  std::string model;
};

}  // namespace kefctl
