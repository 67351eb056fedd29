#pragma once

#include "kefctl/transport.h"
#include "kefctl/types.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace kefctl {

class Controller;

#ifdef KEFCTL_TESTING
namespace test {
int GetPollLoopStarts(const Controller& controller);
}  // namespace test
#endif

/**
 * Lightweight counters for controller activity.
 */
struct ControllerMetrics {
  uint64_t polls = 0;
  uint64_t poll_failures = 0;
  uint64_t commands_sent = 0;
  uint64_t transport_errors = 0;
  uint64_t skip_refreshes = 0;
};

/**
 * Controller configuration; fixed for the lifetime of a Controller.
 */
struct Config {
  /// Previously persisted speaker address (IPv4), empty if unknown.
  std::string device_address;
  /// HTTP port of the speaker API.
  uint16_t port = kDefaultHttpPort;
  /// Volume change applied by VolumeStep().
  int volume_step = 5;
  /// Interval between background refreshes.
  std::chrono::milliseconds poll_interval{3000};
  /// Timeout for each request to the speaker (used for the default transport).
  std::chrono::milliseconds request_timeout{5000};
  /// Delay before refreshing playback info after a track skip.
  std::chrono::milliseconds skip_refresh_delay{500};

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

enum class VolumeDirection {
  kUp,
  kDown,
};

/**
 * Owns the state of one speaker and serializes all access to it.
 */
class Controller {
 public:
  /// Construct a controller; a null transport selects HttpTransport.
  explicit Controller(Config config, std::shared_ptr<Transport> transport = nullptr);
  /// Stop the refresh loop.
  ~Controller();

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  /// Set the speaker address; an address port overrides the configured one.
  void SetAddress(const DeviceAddress& address);
  /// Verify the speaker answers and start background refreshes.
  bool Connect(Error* error = nullptr);
  /// Stop background refreshes; further Connect() calls fail.
  void Close();

  /// Return a copy of the current device state.
  DeviceState GetState() const;
  /// Return metrics for polls, commands and errors.
  ControllerMetrics GetMetrics() const;

  /// Read the volume from the speaker and store it.
  std::optional<int> GetVolume(Error* error = nullptr);
  /// Set the volume, clamped to 0-100.
  bool SetVolume(int level, Error* error = nullptr);
  /// Change the volume by the configured step.
  bool VolumeStep(VolumeDirection direction, Error* error = nullptr);
  /// Parse a decimal volume typed by the user and apply it.
  bool SetVolumeFromText(const std::string& text, Error* error = nullptr);

  /// Skip to the next track.
  bool NextTrack(Error* error = nullptr);
  /// Skip to the previous track.
  bool PreviousTrack(Error* error = nullptr);
  /// Toggle between playing and paused.
  bool PlayPause(Error* error = nullptr);
  /// True if the last known play state is "playing".
  bool IsPlaying() const;

  /// Read now-playing information from the speaker and store it.
  std::optional<PlaybackInfo> RefreshPlaybackInfo(Error* error = nullptr);
  /// Read the speaker model from the firmware release text and store it.
  std::optional<std::string> RefreshModel(Error* error = nullptr);

 private:
  struct Impl;
  std::shared_ptr<Impl> impl_;

#ifdef KEFCTL_TESTING
  friend int test::GetPollLoopStarts(const Controller& controller);
#endif
};

}  // namespace kefctl
