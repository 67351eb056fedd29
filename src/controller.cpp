#include "kefctl/controller.h"
#include "kefctl/test_hooks.h"

#include "internal.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <condition_variable>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <shared_mutex>
#include <system_error>
#include <thread>
#include <utility>

#include <arpa/inet.h>

namespace kefctl {
namespace {

constexpr const char* kPlayingState = "playing";
constexpr const char* kControlRoles = "activate";

int Clamp(int level) {
  return std::max(kMinVolume, std::min(kMaxVolume, level));
}

// Accept an optionally space-padded decimal integer.
bool ParseVolume(const std::string& text, int* out) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  if (begin == end) {
    return false;
  }
  const std::string digits = text.substr(begin, end - begin);
  errno = 0;
  char* parse_end = nullptr;
  const long value = std::strtol(digits.c_str(), &parse_end, 10);
  if (errno != 0 || parse_end != digits.c_str() + digits.size() ||
      value < INT_MIN || value > INT_MAX) {
    return false;
  }
  *out = static_cast<int>(value);
  return true;
}

// Model is the release text up to the first underscore ("LSXII_4.0.1").
bool ParseModelText(const std::string& release_text, std::string* model) {
  std::string parsed = release_text.substr(0, release_text.find('_'));
  if (parsed.empty()) {
    return false;
  }
  *model = std::move(parsed);
  return true;
}

const nlohmann::json* FindObject(const nlohmann::json& parent, const char* key) {
  const auto it = parent.find(key);
  if (it == parent.end() || !it->is_object()) {
    return nullptr;
  }
  return &*it;
}

void CopyString(const nlohmann::json& parent, const char* key, std::string* out) {
  const auto it = parent.find(key);
  if (it != parent.end() && it->is_string()) {
    *out = it->get<std::string>();
  }
}

bool ParsePlayback(const nlohmann::json& body, PlaybackInfo* out, std::string* error) {
  if (!body.is_array() || body.empty()) {
    *error = "empty playback response";
    return false;
  }
  const nlohmann::json& data = body.front();
  if (!data.is_object()) {
    *error = "invalid playback response format";
    return false;
  }

  PlaybackInfo info;
  CopyString(data, "state", &info.state);
  if (const auto* status = FindObject(data, "status")) {
    const auto it = status->find("duration");
    if (it != status->end() && it->is_number()) {
      const double duration = it->get<double>();
      if (std::isfinite(duration) && duration >= INT_MIN && duration <= INT_MAX) {
        info.duration = static_cast<int>(duration);
      }
    }
  }
  if (const auto* track_roles = FindObject(data, "trackRoles")) {
    CopyString(*track_roles, "title", &info.title);
    CopyString(*track_roles, "icon", &info.album_art);
    if (const auto* media_data = FindObject(*track_roles, "mediaData")) {
      if (const auto* meta_data = FindObject(*media_data, "metaData")) {
        CopyString(*meta_data, "artist", &info.artist);
        CopyString(*meta_data, "album", &info.album);
      }
    }
  }
  *out = std::move(info);
  return true;
}

struct ControllerMetricsAtomic {
  std::atomic<uint64_t> polls{0};
  std::atomic<uint64_t> poll_failures{0};
  std::atomic<uint64_t> commands_sent{0};
  std::atomic<uint64_t> transport_errors{0};
  std::atomic<uint64_t> skip_refreshes{0};

  ControllerMetrics Snapshot() const {
    ControllerMetrics snapshot;
    snapshot.polls = polls.load();
    snapshot.poll_failures = poll_failures.load();
    snapshot.commands_sent = commands_sent.load();
    snapshot.transport_errors = transport_errors.load();
    snapshot.skip_refreshes = skip_refreshes.load();
    return snapshot;
  }
};

void Propagate(Error* out, const Error& failure) {
  if (out) {
    *out = failure;
  }
}

}  // namespace

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!device_address.empty()) {
    in_addr parsed{};
    if (inet_pton(AF_INET, device_address.c_str(), &parsed) != 1) {
      return fail("device_address must be a valid IPv4 address");
    }
  }
  if (port == 0) {
    return fail("port must be non-zero");
  }
  if (volume_step <= 0 || volume_step > kMaxVolume) {
    return fail("volume_step must be between 1 and 100");
  }
  if (poll_interval.count() <= 0 || request_timeout.count() <= 0) {
    return fail("poll_interval and request_timeout must be positive");
  }
  if (skip_refresh_delay.count() < 0) {
    return fail("skip_refresh_delay must be >= 0");
  }
  return true;
}

struct Controller::Impl : public std::enable_shared_from_this<Controller::Impl> {
#ifdef KEFCTL_TESTING
  friend int test::GetPollLoopStarts(const Controller& controller);
#endif

  Impl(Config config, std::shared_ptr<Transport> transport)
      : config_(std::move(config)), transport_(std::move(transport)) {
    if (!transport_) {
      transport_ = std::make_shared<HttpTransport>(config_.request_timeout, config_.port);
    }
    state_.address = config_.device_address;
    state_.port = config_.port;
  }

  ~Impl() { Close(); }

  void SetAddress(const DeviceAddress& address) {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    state_.address = address.host;
    if (address.port.has_value()) {
      state_.port = address.port.value();
    }
    state_.last_error.clear();
  }

  bool Connect(Error* error) {
    std::string config_error;
    if (!config_.Validate(&config_error)) {
      Log(LogLevel::kError, "invalid config: " + config_error);
      return internal::Fail(error, ErrorCode::kInvalidInput, config_error);
    }
    if (Closed()) {
      return RefuseClosed(error);
    }
    const DeviceAddress device = Address();
    if (device.empty()) {
      return internal::Fail(error, ErrorCode::kNoHostConfigured, "no IP address set");
    }

    Error failure;
    if (!GetVolume(&failure)) {
      {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        state_.connected = false;
        state_.last_error = failure.message;
      }
      Log(LogLevel::kError,
          "connect to " + device.ToString() + " failed: " + failure.ToString());
      Propagate(error, failure);
      return false;
    }

    Error model_error;
    if (auto model = RefreshModel(&model_error)) {
      Log(LogLevel::kInfo, "speaker model detected: " + *model);
    } else {
      Log(LogLevel::kWarning, "could not get speaker model: " + model_error.ToString());
    }

    {
      std::unique_lock<std::shared_mutex> lock(state_mutex_);
      state_.connected = true;
      state_.powered_on = true;
      state_.last_error.clear();
    }
    if (!StartLoop(error)) {
      return false;
    }
    Log(LogLevel::kInfo, "connected to " + device.ToString());
    return true;
  }

  void Close() {
    std::thread loop;
    {
      std::lock_guard<std::mutex> lock(lifecycle_mutex_);
      closed_ = true;
      loop = std::move(loop_thread_);
    }
    lifecycle_cv_.notify_all();
    if (loop.joinable()) {
      if (loop.get_id() == std::this_thread::get_id()) {
        loop.detach();
      } else {
        loop.join();
      }
    }
  }

  DeviceState GetState() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return state_;
  }

  ControllerMetrics GetMetrics() const { return metrics_.Snapshot(); }

  std::optional<int> GetVolume(Error* error) {
    if (Closed()) {
      RefuseClosed(error);
      return std::nullopt;
    }
    Error failure;
    int volume = 0;
    if (!transport_->GetInt(Address(), kVolumePath, &volume, &failure)) {
      RecordFailure(failure);
      Propagate(error, failure);
      return std::nullopt;
    }
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    state_.volume = volume;
    return volume;
  }

  bool SetVolume(int level, Error* error) {
    if (Closed()) {
      return RefuseClosed(error);
    }
    const int clamped = Clamp(level);
    Error failure;
    if (!transport_->SetInt(Address(), kVolumePath, clamped, &failure)) {
      RecordFailure(failure);
      Propagate(error, failure);
      return false;
    }
    metrics_.commands_sent.fetch_add(1);
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    state_.volume = clamped;
    return true;
  }

  bool VolumeStep(VolumeDirection direction, Error* error) {
    int current = 0;
    {
      std::shared_lock<std::shared_mutex> lock(state_mutex_);
      current = state_.volume;
    }
    const int step = direction == VolumeDirection::kUp ? config_.volume_step
                                                       : -config_.volume_step;
    return SetVolume(current + step, error);
  }

  bool SetVolumeFromText(const std::string& text, Error* error) {
    int level = 0;
    if (!ParseVolume(text, &level)) {
      return internal::Fail(error, ErrorCode::kInvalidInput,
                            "invalid volume '" + text + "'");
    }
    return SetVolume(level, error);
  }

  bool SendControl(const char* control, Error* error) {
    if (Closed()) {
      return RefuseClosed(error);
    }
    const std::string value = std::string("{\"control\":\"") + control + "\"}";
    Error failure;
    if (!transport_->SetData(Address(), kPlayerControlPath, kControlRoles, value,
                             &failure)) {
      RecordFailure(failure);
      Propagate(error, failure);
      return false;
    }
    metrics_.commands_sent.fetch_add(1);
    ScheduleDelayedRefresh();
    return true;
  }

  bool IsPlaying() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return state_.playback.has_value() && state_.playback->state == kPlayingState;
  }

  std::optional<PlaybackInfo> RefreshPlaybackInfo(Error* error) {
    if (Closed()) {
      RefuseClosed(error);
      return std::nullopt;
    }
    Error failure;
    nlohmann::json body;
    if (!transport_->GetData(Address(), kPlayerDataPath, "value", &body, &failure)) {
      RecordFailure(failure);
      Propagate(error, failure);
      return std::nullopt;
    }
    PlaybackInfo info;
    std::string parse_error;
    if (!ParsePlayback(body, &info, &parse_error)) {
      failure = Error{ErrorCode::kMalformedResponse, parse_error};
      RecordFailure(failure);
      Propagate(error, failure);
      return std::nullopt;
    }
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    state_.playback = info;
    return info;
  }

  std::optional<std::string> RefreshModel(Error* error) {
    if (Closed()) {
      RefuseClosed(error);
      return std::nullopt;
    }
    Error failure;
    std::string release_text;
    if (!transport_->GetString(Address(), kReleaseTextPath, &release_text, &failure)) {
      RecordFailure(failure);
      Propagate(error, failure);
      return std::nullopt;
    }
    std::string model;
    if (!ParseModelText(release_text, &model)) {
      failure = Error{ErrorCode::kMalformedResponse, "invalid release text format"};
      RecordFailure(failure);
      Propagate(error, failure);
      return std::nullopt;
    }
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    state_.model = model;
    return model;
  }

 private:
  bool Closed() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return closed_;
  }

  static bool RefuseClosed(Error* error) {
    return internal::Fail(error, ErrorCode::kCancelled, "controller is closed");
  }

  DeviceAddress Address() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    DeviceAddress address;
    address.host = state_.address;
    address.port = state_.port;
    return address;
  }

  void RecordFailure(const Error& failure) {
    if (failure.code == ErrorCode::kTransportError || failure.code == ErrorCode::kTimeout) {
      metrics_.transport_errors.fetch_add(1);
    }
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    state_.last_error = failure.message;
  }

  void Log(LogLevel level, const std::string& message) const {
    internal::Log(config_.log_callback, level, message);
  }

  bool StartLoop(Error* error) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (closed_) {
      return RefuseClosed(error);
    }
    if (loop_started_) {
      return true;
    }
    try {
      loop_thread_ = std::thread([this]() { PollLoop(); });
    } catch (const std::system_error& ex) {
      const std::string message = std::string("refresh loop start failed: ") + ex.what();
      Log(LogLevel::kError, message);
      return internal::Fail(error, ErrorCode::kTransportError, message);
    }
    loop_started_ = true;
    loop_starts_.fetch_add(1);
    return true;
  }

  // Re-read volume and playback every poll interval while connected.
  void PollLoop() {
    std::unique_lock<std::mutex> lock(lifecycle_mutex_);
    while (!closed_) {
      if (lifecycle_cv_.wait_for(lock, config_.poll_interval, [this]() { return closed_; })) {
        break;
      }
      lock.unlock();
      PollOnce();
      lock.lock();
    }
  }

  void PollOnce() {
    bool connected = false;
    {
      std::shared_lock<std::shared_mutex> lock(state_mutex_);
      connected = state_.connected;
    }
    if (!connected) {
      return;
    }
    metrics_.polls.fetch_add(1);
    bool failed = false;
    Error failure;
    // Every transport call re-checks closed_, so nothing is sent once Close()
    // has begun.
    if (!GetVolume(&failure)) {
      if (failure.code == ErrorCode::kCancelled) {
        return;
      }
      failed = true;
      Log(LogLevel::kWarning, "refresh volume failed: " + failure.ToString());
    }
    if (!RefreshPlaybackInfo(&failure)) {
      if (failure.code == ErrorCode::kCancelled) {
        return;
      }
      failed = true;
      Log(LogLevel::kWarning, "refresh playback failed: " + failure.ToString());
    }
    if (failed) {
      metrics_.poll_failures.fetch_add(1);
    }
  }

  // Refresh playback info shortly after a transport command, unless the
  // controller is closed first.
  void ScheduleDelayedRefresh() {
    std::shared_ptr<Impl> self = shared_from_this();
    try {
      std::thread([self]() {
        {
          std::unique_lock<std::mutex> lock(self->lifecycle_mutex_);
          if (self->lifecycle_cv_.wait_for(lock, self->config_.skip_refresh_delay,
                                           [&self]() { return self->closed_; })) {
            return;
          }
        }
        self->metrics_.skip_refreshes.fetch_add(1);
        Error failure;
        if (!self->RefreshPlaybackInfo(&failure) &&
            failure.code != ErrorCode::kCancelled) {
          self->Log(LogLevel::kWarning,
                    "delayed playback refresh failed: " + failure.ToString());
        }
      }).detach();
    } catch (const std::system_error& ex) {
      Log(LogLevel::kWarning, std::string("delayed refresh not scheduled: ") + ex.what());
    }
  }

  Config config_;
  std::shared_ptr<Transport> transport_;

  mutable std::shared_mutex state_mutex_;
  DeviceState state_;

  mutable std::mutex lifecycle_mutex_;
  std::condition_variable lifecycle_cv_;
  bool closed_ = false;
  bool loop_started_ = false;
  std::atomic<int> loop_starts_{0};
  std::thread loop_thread_;

  ControllerMetricsAtomic metrics_;
};

Controller::Controller(Config config, std::shared_ptr<Transport> transport)
    : impl_(std::make_shared<Impl>(std::move(config), std::move(transport))) {}

Controller::~Controller() {
  impl_->Close();
}

void Controller::SetAddress(const DeviceAddress& address) {
  impl_->SetAddress(address);
}

bool Controller::Connect(Error* error) {
  return impl_->Connect(error);
}

void Controller::Close() {
  impl_->Close();
}

DeviceState Controller::GetState() const {
  return impl_->GetState();
}

ControllerMetrics Controller::GetMetrics() const {
  return impl_->GetMetrics();
}

std::optional<int> Controller::GetVolume(Error* error) {
  return impl_->GetVolume(error);
}

bool Controller::SetVolume(int level, Error* error) {
  return impl_->SetVolume(level, error);
}

bool Controller::VolumeStep(VolumeDirection direction, Error* error) {
  return impl_->VolumeStep(direction, error);
}

bool Controller::SetVolumeFromText(const std::string& text, Error* error) {
  return impl_->SetVolumeFromText(text, error);
}

bool Controller::NextTrack(Error* error) {
  return impl_->SendControl("next", error);
}

bool Controller::PreviousTrack(Error* error) {
  return impl_->SendControl("previous", error);
}

bool Controller::PlayPause(Error* error) {
  return impl_->SendControl("pause", error);
}

bool Controller::IsPlaying() const {
  return impl_->IsPlaying();
}

std::optional<PlaybackInfo> Controller::RefreshPlaybackInfo(Error* error) {
  return impl_->RefreshPlaybackInfo(error);
}

std::optional<std::string> Controller::RefreshModel(Error* error) {
  return impl_->RefreshModel(error);
}

#ifdef KEFCTL_TESTING
namespace test {

int ClampVolume(int level) {
  return Clamp(level);
}

bool ParseVolumeText(const std::string& text, int* out) {
  return ParseVolume(text, out);
}

bool ParseModel(const std::string& release_text, std::string* model) {
  return ParseModelText(release_text, model);
}

bool ParsePlaybackInfo(const nlohmann::json& body, PlaybackInfo* out,
                       std::string* error) {
  std::string parse_error;
  PlaybackInfo info;
  if (!ParsePlayback(body, &info, &parse_error)) {
    if (error) {
      *error = parse_error;
    }
    return false;
  }
  if (out) {
    *out = info;
  }
  return true;
}

int GetPollLoopStarts(const Controller& controller) {
  return controller.impl_->loop_starts_.load();
}

}  // namespace test
#endif

}  // namespace kefctl
