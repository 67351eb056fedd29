#pragma once

#include "kefctl/transport.h"
#include "kefctl/types.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kefctl {

/**
 * Local IPv4 interface as reported by getifaddrs().
 */
struct NetworkInterface {
  std::string name;
  /// IPv4 address in dotted form.
  std::string address;
  bool up = false;
  bool loopback = false;
  bool multicast = false;
};

using InterfaceLister = std::function<std::vector<NetworkInterface>()>;

/// Enumerate IPv4 interfaces on this host (including down/loopback ones).
std::vector<NetworkInterface> ListNetworkInterfaces();

/// Shared cancellation flag; set to true to cancel a discovery in progress.
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

/// Create a fresh, unset cancellation flag.
CancelFlag MakeCancelFlag();

/**
 * Outcome of a discovery strategy or of the whole discovery.
 */
struct DiscoveryResult {
  /// Address of the device found, if any.
  std::optional<DeviceAddress> address;
  /// kNone on success, otherwise kTimeout, kNoDeviceFound or kCancelled.
  Error error;
  /// Name of the strategy that produced this result ("ssdp", "sweep").
  std::string strategy;

  bool ok() const { return address.has_value(); }

  static DiscoveryResult Found(DeviceAddress address, std::string strategy);
  static DiscoveryResult Failed(ErrorCode code, std::string message,
                                std::string strategy);
};

/**
 * Discovery configuration shared by the multicast prober and subnet sweeper.
 */
struct DiscoveryConfig {
  /// HTTP port probed by the subnet sweep.
  uint16_t http_port = kDefaultHttpPort;
  /// Timeout of a single sweep probe.
  std::chrono::milliseconds probe_timeout{1000};
  /// Upper bound on how long one SSDP socket read blocks before the task
  /// re-checks its stop conditions.
  std::chrono::milliseconds read_slice{200};
  /// SSDP search targets sent, in order, on every interface.
  std::vector<std::string> search_targets = {
      "upnp:rootdevice",
      "urn:schemas-upnp-org:device:MediaRenderer:1",
      "ssdp:all",
  };
  /// Upper-case substrings that mark a reply as coming from the vendor.
  std::vector<std::string> vendor_markers = {"KEF", "LSX", "LS50"};
  /// Maximum number of sweep probes in flight; 0 leaves the sweep unbounded.
  int max_in_flight_probes = 0;

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

/**
 * One way of locating the speaker within a time budget.
 */
class DiscoveryStrategy {
 public:
  virtual ~DiscoveryStrategy() = default;

  /// Short name used in logs and in DiscoveryResult::strategy.
  virtual const char* name() const = 0;

  /**
   * Look for a device for at most `budget`.
   *
   * @param cancel Flag checked while running; may be null.
   */
  virtual DiscoveryResult Run(std::chrono::milliseconds budget,
                              const CancelFlag& cancel) = 0;
};

/**
 * SSDP M-SEARCH on every usable interface in parallel; the first reply
 * carrying a vendor marker wins.
 */
class MulticastProber : public DiscoveryStrategy {
 public:
  using StopPredicate = std::function<bool()>;
  /// Probe one interface until `deadline` or `should_stop()`; returns the
  /// address of the first qualifying reply.
  using InterfaceProbe = std::function<std::optional<std::string>(
      const NetworkInterface&, std::chrono::steady_clock::time_point deadline,
      const StopPredicate& should_stop)>;

  explicit MulticastProber(DiscoveryConfig config = {});
  /// Construct with injected interface enumeration and per-interface probe.
  MulticastProber(DiscoveryConfig config, InterfaceLister lister,
                  InterfaceProbe probe);

  const char* name() const override { return "ssdp"; }
  DiscoveryResult Run(std::chrono::milliseconds budget,
                      const CancelFlag& cancel) override;

 private:
  std::optional<std::string> ProbeInterface(
      const NetworkInterface& iface,
      std::chrono::steady_clock::time_point deadline,
      const StopPredicate& should_stop) const;

  DiscoveryConfig config_;
  InterfaceLister lister_;
  InterfaceProbe probe_;
};

/**
 * Probe every host of every local /24 for the vendor HTTP API.
 */
class SubnetSweeper : public DiscoveryStrategy {
 public:
  explicit SubnetSweeper(DiscoveryConfig config = {});
  /// Construct with an injected interface enumeration and probe transport.
  SubnetSweeper(DiscoveryConfig config, InterfaceLister lister,
                std::shared_ptr<Transport> transport);

  const char* name() const override { return "sweep"; }
  DiscoveryResult Run(std::chrono::milliseconds budget,
                      const CancelFlag& cancel) override;

 private:
  DiscoveryConfig config_;
  InterfaceLister lister_;
  std::shared_ptr<Transport> transport_;
};

/**
 * Two-stage discovery: multicast first with half the budget, then the subnet
 * sweep with the remainder.
 */
class Discoverer {
 public:
  /// Use MulticastProber and SubnetSweeper built from `config`.
  explicit Discoverer(DiscoveryConfig config = {});
  /// Use the given strategies; a null strategy is replaced by the default one.
  Discoverer(std::unique_ptr<DiscoveryStrategy> prober,
             std::unique_ptr<DiscoveryStrategy> sweeper,
             LogCallback log_callback = {});

  Discoverer(const Discoverer&) = delete;
  Discoverer& operator=(const Discoverer&) = delete;

  /// Locate a device within `timeout`.
  DiscoveryResult Discover(std::chrono::milliseconds timeout);
  /// Cancel the discovery in progress, if any.
  void Cancel();

 private:
  std::unique_ptr<DiscoveryStrategy> prober_;
  std::unique_ptr<DiscoveryStrategy> sweeper_;
  LogCallback log_callback_;

  std::mutex cancel_mutex_;
  CancelFlag active_cancel_;
};

}  // namespace kefctl
