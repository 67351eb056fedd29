#pragma once

#include "kefctl/types.h"

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace kefctl {

/**
 * Request/response access to the speaker's `/api/getData` and `/api/setData`
 * endpoints. Implementations must be safe to call from several threads at
 * once; the target device is passed on every call.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  /**
   * Fetch `path` with the given roles and return the decoded JSON body.
   *
   * @param out Receives the decoded JSON document on success.
   * @param error Optional output describing the failure.
   * @return true on a 2xx response with a valid JSON body.
   */
  virtual bool GetData(const DeviceAddress& device,
                       const std::string& path,
                       const std::string& roles,
                       nlohmann::json* out,
                       Error* error = nullptr) = 0;

  /**
   * Write `value` (a JSON document in text form) to `path`.
   *
   * @return true on a 2xx response.
   */
  virtual bool SetData(const DeviceAddress& device,
                       const std::string& path,
                       const std::string& roles,
                       const std::string& value,
                       Error* error = nullptr) = 0;

  /// Read the `i32_` member of the first element returned for `path`.
  virtual bool GetInt(const DeviceAddress& device, const std::string& path,
                      int* out, Error* error = nullptr);
  /// Read the `string_` member of the first element returned for `path`.
  virtual bool GetString(const DeviceAddress& device, const std::string& path,
                         std::string* out, Error* error = nullptr);
  /// Write an `i32_` value to `path`.
  virtual bool SetInt(const DeviceAddress& device, const std::string& path,
                      int value, Error* error = nullptr);
  /// Return true if `device` answers the device-name query with the vendor's
  /// response envelope.
  virtual bool ProbeExistence(const DeviceAddress& device, Error* error = nullptr);
};

/**
 * Transport speaking HTTP/1.1 over plain POSIX TCP sockets.
 */
class HttpTransport : public Transport {
 public:
  /// Construct a transport whose connect/read/write steps are bounded by `timeout`.
  explicit HttpTransport(std::chrono::milliseconds timeout,
                         uint16_t default_port = kDefaultHttpPort);

  bool GetData(const DeviceAddress& device,
               const std::string& path,
               const std::string& roles,
               nlohmann::json* out,
               Error* error = nullptr) override;

  bool SetData(const DeviceAddress& device,
               const std::string& path,
               const std::string& roles,
               const std::string& value,
               Error* error = nullptr) override;

 private:
  bool Get(const DeviceAddress& device, const std::string& target,
           std::string* body, Error* error);

  std::chrono::milliseconds timeout_;
  uint16_t default_port_;
};

/// Path used for the speaker volume (integer 0-100).
constexpr const char* kVolumePath = "player:volume";
/// Path holding the firmware release text ("LSXII_4.0.1").
constexpr const char* kReleaseTextPath = "settings:/releasetext";
/// Path holding the user-visible device name.
constexpr const char* kDeviceNamePath = "settings:/deviceName";
/// Path returning now-playing data.
constexpr const char* kPlayerDataPath = "player:player/data";
/// Path accepting playback control commands.
constexpr const char* kPlayerControlPath = "player:player/control";

}  // namespace kefctl
