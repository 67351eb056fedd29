#include "kefctl/discovery.h"
#include "kefctl/result_slot.h"
#include "kefctl/test_hooks.h"

#include "internal.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <exception>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace kefctl {
namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kMaxDatagramSize = 4096;
constexpr int kFirstHost = 1;
constexpr int kLastHost = 254;

bool IsUsable(const NetworkInterface& iface) {
  return iface.up && !iface.loopback && !iface.address.empty();
}

std::string MSearchRequest(const std::string& search_target) {
  std::ostringstream oss;
  oss << "M-SEARCH * HTTP/1.1\r\n"
      << "HOST: " << kSsdpMulticastAddress << ":" << kSsdpPort << "\r\n"
      << "MAN: \"ssdp:discover\"\r\n"
      << "ST: " << search_target << "\r\n"
      << "MX: 3\r\n"
      << "\r\n";
  return oss.str();
}

bool QualifyingReply(const std::string& payload,
                     const std::vector<std::string>& vendor_markers) {
  std::string upper = payload;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  for (const auto& marker : vendor_markers) {
    if (!marker.empty() && upper.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

// "192.168.1.20" -> "192.168.1"
std::optional<std::string> Prefix24(const std::string& ipv4) {
  in_addr parsed{};
  if (inet_pton(AF_INET, ipv4.c_str(), &parsed) != 1) {
    return std::nullopt;
  }
  const uint32_t host_order = ntohl(parsed.s_addr);
  std::ostringstream oss;
  oss << ((host_order >> 24) & 0xff) << "." << ((host_order >> 16) & 0xff) << "."
      << ((host_order >> 8) & 0xff);
  return oss.str();
}

std::vector<std::string> SweepPrefixes(const std::vector<NetworkInterface>& interfaces) {
  std::vector<std::string> prefixes;
  for (const auto& iface : interfaces) {
    if (!IsUsable(iface)) {
      continue;
    }
    auto prefix = Prefix24(iface.address);
    if (!prefix) {
      continue;
    }
    if (std::find(prefixes.begin(), prefixes.end(), *prefix) == prefixes.end()) {
      prefixes.push_back(*prefix);
    }
  }
  return prefixes;
}

// UDP socket joined to the SSDP group on a single interface.
class MulticastSocket {
 public:
  MulticastSocket() = default;
  ~MulticastSocket() { Close(); }

  MulticastSocket(const MulticastSocket&) = delete;
  MulticastSocket& operator=(const MulticastSocket&) = delete;

  bool Open(const NetworkInterface& iface) {
    in_addr local{};
    if (inet_pton(AF_INET, iface.address.c_str(), &local) != 1) {
      last_error_ = "invalid interface address " + iface.address;
      return false;
    }
    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
      last_error_ = "socket() failed: " + std::string(std::strerror(errno));
      return false;
    }
    int reuse = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
      return FailWithErrno("setsockopt(SO_REUSEADDR)");
    }
    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_port = htons(kSsdpPort);
    bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
      return FailWithErrno("bind(0.0.0.0:1900)");
    }
    ip_mreq membership{};
    inet_pton(AF_INET, kSsdpMulticastAddress, &membership.imr_multiaddr);
    membership.imr_interface = local;
    if (::setsockopt(fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership,
                     sizeof(membership)) < 0) {
      return FailWithErrno("setsockopt(IP_ADD_MEMBERSHIP)");
    }
    if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_IF, &local, sizeof(local)) < 0) {
      return FailWithErrno("setsockopt(IP_MULTICAST_IF)");
    }
    return true;
  }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  const std::string& last_error() const { return last_error_; }

  bool SendToGroup(const std::string& payload) {
    sockaddr_in group{};
    group.sin_family = AF_INET;
    group.sin_port = htons(kSsdpPort);
    inet_pton(AF_INET, kSsdpMulticastAddress, &group.sin_addr);
    const ssize_t sent = ::sendto(fd_, payload.data(), payload.size(), 0,
                                  reinterpret_cast<const sockaddr*>(&group),
                                  sizeof(group));
    if (sent < 0) {
      last_error_ = "sendto() failed: " + std::string(std::strerror(errno));
      return false;
    }
    return true;
  }

  // Wait up to `wait` for a datagram. Returns 1 when one was read, 0 on
  // timeout and -1 on error.
  int Receive(std::chrono::milliseconds wait, std::string* payload, std::string* sender) {
    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(fd_, &read_fds);
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(wait.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((wait.count() % 1000) * 1000);
    const int ready = ::select(fd_ + 1, &read_fds, nullptr, nullptr, &tv);
    if (ready == 0 || (ready < 0 && errno == EINTR)) {
      return 0;
    }
    if (ready < 0) {
      last_error_ = "select() failed: " + std::string(std::strerror(errno));
      return -1;
    }
    char buffer[kMaxDatagramSize];
    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t length = ::recvfrom(fd_, buffer, sizeof(buffer), 0,
                                      reinterpret_cast<sockaddr*>(&from), &from_len);
    if (length < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        return 0;
      }
      last_error_ = "recvfrom() failed: " + std::string(std::strerror(errno));
      return -1;
    }
    payload->assign(buffer, static_cast<size_t>(length));
    char text[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &from.sin_addr, text, sizeof(text));
    *sender = text;
    return 1;
  }

 private:
  bool FailWithErrno(const char* what) {
    last_error_ = std::string(what) + " failed: " + std::strerror(errno);
    Close();
    return false;
  }

  int fd_ = -1;
  std::string last_error_;
};

// State shared between a sweep and its detached probe threads.
struct SweepState {
  ResultSlot<std::string> slot;
  std::shared_ptr<Transport> transport;
  std::mutex mutex;
  std::condition_variable cv;
  int in_flight = 0;
};

bool IsCancelled(const CancelFlag& cancel) {
  return cancel && cancel->load();
}

}  // namespace

std::vector<NetworkInterface> ListNetworkInterfaces() {
  std::vector<NetworkInterface> interfaces;
  ifaddrs* list = nullptr;
  if (::getifaddrs(&list) != 0) {
    return interfaces;
  }
  for (ifaddrs* entry = list; entry != nullptr; entry = entry->ifa_next) {
    if (!entry->ifa_addr || entry->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    NetworkInterface iface;
    iface.name = entry->ifa_name ? entry->ifa_name : "";
    char text[INET_ADDRSTRLEN] = {};
    const auto* addr = reinterpret_cast<const sockaddr_in*>(entry->ifa_addr);
    inet_ntop(AF_INET, &addr->sin_addr, text, sizeof(text));
    iface.address = text;
    iface.up = (entry->ifa_flags & IFF_UP) != 0;
    iface.loopback = (entry->ifa_flags & IFF_LOOPBACK) != 0;
    iface.multicast = (entry->ifa_flags & IFF_MULTICAST) != 0;
    interfaces.push_back(std::move(iface));
  }
  ::freeifaddrs(list);
  return interfaces;
}

CancelFlag MakeCancelFlag() {
  return std::make_shared<std::atomic<bool>>(false);
}

DiscoveryResult DiscoveryResult::Found(DeviceAddress address, std::string strategy) {
  DiscoveryResult result;
  result.address = std::move(address);
  result.strategy = std::move(strategy);
  return result;
}

DiscoveryResult DiscoveryResult::Failed(ErrorCode code, std::string message,
                                        std::string strategy) {
  DiscoveryResult result;
  result.error.code = code;
  result.error.message = std::move(message);
  result.strategy = std::move(strategy);
  return result;
}

bool DiscoveryConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (http_port == 0) {
    return fail("http_port must be non-zero");
  }
  if (probe_timeout.count() <= 0 || read_slice.count() <= 0) {
    return fail("probe_timeout and read_slice must be positive");
  }
  if (search_targets.empty()) {
    return fail("search_targets must not be empty");
  }
  if (vendor_markers.empty()) {
    return fail("vendor_markers must not be empty");
  }
  for (const auto& marker : vendor_markers) {
    for (char c : marker) {
      if (std::islower(static_cast<unsigned char>(c))) {
        return fail("vendor_markers must be upper-case");
      }
    }
  }
  if (max_in_flight_probes < 0) {
    return fail("max_in_flight_probes must be >= 0");
  }
  return true;
}

MulticastProber::MulticastProber(DiscoveryConfig config)
    : config_(std::move(config)), lister_(ListNetworkInterfaces) {}

MulticastProber::MulticastProber(DiscoveryConfig config, InterfaceLister lister,
                                 InterfaceProbe probe)
    : config_(std::move(config)), lister_(std::move(lister)), probe_(std::move(probe)) {
  if (!lister_) {
    lister_ = ListNetworkInterfaces;
  }
}

std::optional<std::string> MulticastProber::ProbeInterface(
    const NetworkInterface& iface, Clock::time_point deadline,
    const StopPredicate& should_stop) const {
  MulticastSocket socket;
  if (!socket.Open(iface)) {
    internal::Log(config_.log_callback, LogLevel::kWarning,
                  "ssdp: " + iface.name + ": " + socket.last_error());
    return std::nullopt;
  }
  for (const auto& target : config_.search_targets) {
    if (should_stop()) {
      return std::nullopt;
    }
    if (!socket.SendToGroup(MSearchRequest(target))) {
      internal::Log(config_.log_callback, LogLevel::kWarning,
                    "ssdp: " + iface.name + ": " + socket.last_error());
    }
  }

  std::string payload;
  std::string sender;
  while (!should_stop()) {
    const auto now = Clock::now();
    if (now >= deadline) {
      break;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    const int received =
        socket.Receive(std::min(remaining, config_.read_slice), &payload, &sender);
    if (received < 0) {
      internal::Log(config_.log_callback, LogLevel::kWarning,
                    "ssdp: " + iface.name + ": " + socket.last_error());
      break;
    }
    if (received > 0 && QualifyingReply(payload, config_.vendor_markers)) {
      return sender;
    }
  }
  return std::nullopt;
}

DiscoveryResult MulticastProber::Run(std::chrono::milliseconds budget,
                                     const CancelFlag& cancel) {
  std::string config_error;
  if (!config_.Validate(&config_error)) {
    internal::Log(config_.log_callback, LogLevel::kError,
                  "invalid discovery config: " + config_error);
    return DiscoveryResult::Failed(ErrorCode::kInvalidInput, config_error, name());
  }
  if (IsCancelled(cancel)) {
    return DiscoveryResult::Failed(ErrorCode::kCancelled, "discovery cancelled", name());
  }
  const auto deadline = Clock::now() + budget;

  std::vector<NetworkInterface> usable;
  for (auto& iface : lister_()) {
    if (IsUsable(iface)) {
      usable.push_back(std::move(iface));
    }
  }
  if (usable.empty()) {
    return DiscoveryResult::Failed(ErrorCode::kNoDeviceFound,
                                   "no usable network interfaces", name());
  }

  ResultSlot<std::string> slot;
  std::atomic<bool> stop{false};
  const StopPredicate should_stop = [&]() {
    return stop.load() || IsCancelled(cancel) || slot.Settled();
  };

  std::vector<std::thread> tasks;
  tasks.reserve(usable.size());
  for (const auto& iface : usable) {
    slot.AddProducer();
    try {
      tasks.emplace_back([&, iface]() {
        try {
          const auto address = probe_ ? probe_(iface, deadline, should_stop)
                                      : ProbeInterface(iface, deadline, should_stop);
          if (address) {
            slot.Offer(*address);
          }
        } catch (const std::exception& ex) {
          internal::Log(config_.log_callback, LogLevel::kError,
                        "ssdp: " + iface.name + ": probe failed: " + ex.what());
        }
        slot.ProducerDone();
      });
    } catch (const std::system_error& ex) {
      slot.ProducerDone();
      internal::Log(config_.log_callback, LogLevel::kError,
                    std::string("ssdp: failed to start task: ") + ex.what());
    }
  }
  slot.Seal();

  std::string address;
  const auto outcome = slot.WaitUntil(deadline, cancel.get(), &address);
  stop.store(true);
  for (auto& task : tasks) {
    task.join();
  }

  switch (outcome) {
    case ResultSlot<std::string>::Outcome::kValue:
      return DiscoveryResult::Found(DeviceAddress{address, std::nullopt}, name());
    case ResultSlot<std::string>::Outcome::kCancelled:
      return DiscoveryResult::Failed(ErrorCode::kCancelled, "discovery cancelled", name());
    case ResultSlot<std::string>::Outcome::kExhausted:
      return DiscoveryResult::Failed(ErrorCode::kNoDeviceFound,
                                     "SSDP discovery failed - no device found", name());
    case ResultSlot<std::string>::Outcome::kTimeout:
      break;
  }
  return DiscoveryResult::Failed(ErrorCode::kTimeout, "SSDP discovery timeout", name());
}

SubnetSweeper::SubnetSweeper(DiscoveryConfig config)
    : SubnetSweeper(config, ListNetworkInterfaces, nullptr) {}

SubnetSweeper::SubnetSweeper(DiscoveryConfig config, InterfaceLister lister,
                             std::shared_ptr<Transport> transport)
    : config_(std::move(config)), lister_(std::move(lister)), transport_(std::move(transport)) {
  if (!lister_) {
    lister_ = ListNetworkInterfaces;
  }
  if (!transport_) {
    transport_ = std::make_shared<HttpTransport>(config_.probe_timeout, config_.http_port);
  }
}

DiscoveryResult SubnetSweeper::Run(std::chrono::milliseconds budget,
                                   const CancelFlag& cancel) {
  std::string config_error;
  if (!config_.Validate(&config_error)) {
    internal::Log(config_.log_callback, LogLevel::kError,
                  "invalid discovery config: " + config_error);
    return DiscoveryResult::Failed(ErrorCode::kInvalidInput, config_error, name());
  }
  if (IsCancelled(cancel)) {
    return DiscoveryResult::Failed(ErrorCode::kCancelled, "discovery cancelled", name());
  }
  const auto deadline = Clock::now() + budget;

  const auto prefixes = SweepPrefixes(lister_());
  if (prefixes.empty()) {
    return DiscoveryResult::Failed(ErrorCode::kNoDeviceFound,
                                   "no local network interfaces found", name());
  }

  auto state = std::make_shared<SweepState>();
  state->transport = transport_;
  const std::optional<uint16_t> port =
      config_.http_port == kDefaultHttpPort ? std::nullopt
                                            : std::optional<uint16_t>(config_.http_port);

  auto stop_launching = [&]() {
    return IsCancelled(cancel) || Clock::now() >= deadline || state->slot.Settled();
  };

  bool launching = true;
  for (const auto& prefix : prefixes) {
    for (int host = kFirstHost; host <= kLastHost && launching; ++host) {
      if (config_.max_in_flight_probes > 0) {
        std::unique_lock<std::mutex> lock(state->mutex);
        while (state->in_flight >= config_.max_in_flight_probes && !stop_launching()) {
          state->cv.wait_for(lock, ResultSlot<std::string>::kCancelPollInterval);
        }
      }
      if (stop_launching()) {
        launching = false;
        break;
      }

      DeviceAddress target{prefix + "." + std::to_string(host), port};
      state->slot.AddProducer();
      {
        std::lock_guard<std::mutex> lock(state->mutex);
        ++state->in_flight;
      }
      try {
        std::thread([state, target, log = config_.log_callback]() {
          try {
            Error error;
            if (!state->slot.Settled() &&
                state->transport->ProbeExistence(target, &error)) {
              state->slot.Offer(target.host);
            }
          } catch (const std::exception& ex) {
            internal::Log(log, LogLevel::kError,
                          "sweep: probe of " + target.host + " failed: " + ex.what());
          }
          {
            std::lock_guard<std::mutex> lock(state->mutex);
            --state->in_flight;
          }
          state->cv.notify_all();
          state->slot.ProducerDone();
        }).detach();
      } catch (const std::system_error& ex) {
        {
          std::lock_guard<std::mutex> lock(state->mutex);
          --state->in_flight;
        }
        state->slot.ProducerDone();
        internal::Log(config_.log_callback, LogLevel::kWarning,
                      std::string("sweep: stopped launching probes: ") + ex.what());
        launching = false;
      }
    }
    if (!launching) {
      break;
    }
  }
  state->slot.Seal();

  std::string address;
  const auto outcome = state->slot.WaitUntil(deadline, cancel.get(), &address);
  if (outcome != ResultSlot<std::string>::Outcome::kValue) {
    // Stragglers skip their probe and drop any late result.
    state->slot.Cancel();
  }

  switch (outcome) {
    case ResultSlot<std::string>::Outcome::kValue:
      return DiscoveryResult::Found(DeviceAddress{address, port}, name());
    case ResultSlot<std::string>::Outcome::kCancelled:
      return DiscoveryResult::Failed(ErrorCode::kCancelled, "discovery cancelled", name());
    case ResultSlot<std::string>::Outcome::kExhausted:
      return DiscoveryResult::Failed(ErrorCode::kNoDeviceFound,
                                     "speaker not found on network", name());
    case ResultSlot<std::string>::Outcome::kTimeout:
      break;
  }
  return DiscoveryResult::Failed(ErrorCode::kTimeout, "network scan timeout", name());
}

Discoverer::Discoverer(DiscoveryConfig config)
    : prober_(std::make_unique<MulticastProber>(config)),
      sweeper_(std::make_unique<SubnetSweeper>(config)),
      log_callback_(config.log_callback) {}

Discoverer::Discoverer(std::unique_ptr<DiscoveryStrategy> prober,
                       std::unique_ptr<DiscoveryStrategy> sweeper,
                       LogCallback log_callback)
    : prober_(std::move(prober)),
      sweeper_(std::move(sweeper)),
      log_callback_(std::move(log_callback)) {
  DiscoveryConfig defaults;
  defaults.log_callback = log_callback_;
  if (!prober_) {
    prober_ = std::make_unique<MulticastProber>(defaults);
  }
  if (!sweeper_) {
    sweeper_ = std::make_unique<SubnetSweeper>(defaults);
  }
}

DiscoveryResult Discoverer::Discover(std::chrono::milliseconds timeout) {
  CancelFlag cancel = MakeCancelFlag();
  {
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    active_cancel_ = cancel;
  }

  const auto first_budget = timeout / 2;
  internal::Log(log_callback_, LogLevel::kInfo,
                std::string("discovery: trying ") + prober_->name());
  DiscoveryResult result = prober_->Run(first_budget, cancel);
  if (result.ok()) {
    internal::Log(log_callback_, LogLevel::kInfo,
                  "discovery: found " + result.address->ToString() + " via " +
                      result.strategy);
  } else {
    internal::Log(log_callback_, LogLevel::kInfo,
                  std::string("discovery: ") + prober_->name() + " failed (" +
                      result.error.ToString() + "), trying " + sweeper_->name());
    result = sweeper_->Run(timeout - first_budget, cancel);
    if (result.ok()) {
      internal::Log(log_callback_, LogLevel::kInfo,
                    "discovery: found " + result.address->ToString() + " via " +
                        result.strategy);
    } else {
      internal::Log(log_callback_, LogLevel::kWarning,
                    "discovery: " + result.error.ToString());
    }
  }

  std::lock_guard<std::mutex> lock(cancel_mutex_);
  if (active_cancel_ == cancel) {
    active_cancel_.reset();
  }
  return result;
}

void Discoverer::Cancel() {
  std::lock_guard<std::mutex> lock(cancel_mutex_);
  if (active_cancel_) {
    active_cancel_->store(true);
  }
}

#ifdef KEFCTL_TESTING
namespace test {

std::string BuildMSearchRequest(const std::string& search_target) {
  return MSearchRequest(search_target);
}

bool IsQualifyingReply(const std::string& payload,
                       const std::vector<std::string>& vendor_markers) {
  return QualifyingReply(payload, vendor_markers);
}

std::optional<std::string> SubnetPrefix(const std::string& ipv4) {
  return Prefix24(ipv4);
}

std::vector<std::string> CollectSweepPrefixes(
    const std::vector<NetworkInterface>& interfaces) {
  return SweepPrefixes(interfaces);
}

}  // namespace test
#endif

}  // namespace kefctl
