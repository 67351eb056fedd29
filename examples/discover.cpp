// Example: locate a speaker on the local network and print its address.
#include "kefctl/kefctl.h"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  std::chrono::milliseconds timeout{10000};
  if (argc > 1) {
    const long seconds = std::strtol(argv[1], nullptr, 10);
    if (seconds <= 0) {
      std::cout << "Usage: kefctl_discover [timeout_seconds]\n";
      return 1;
    }
    timeout = std::chrono::seconds(seconds);
  }

  kefctl::DiscoveryConfig config;
  config.log_callback = [](kefctl::LogLevel level, const std::string& message) {
    std::cerr << "[" << kefctl::LogLevelName(level) << "] " << message << std::endl;
  };
  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Configuration error: " << error << "\n";
    return 1;
  }

  std::cout << "Interfaces:\n";
  for (const auto& iface : kefctl::ListNetworkInterfaces()) {
    std::cout << "  " << iface.name << " " << iface.address
              << (iface.up ? " up" : " down")
              << (iface.loopback ? " loopback" : "")
              << (iface.multicast ? " multicast" : "") << "\n";
  }

  kefctl::Discoverer discoverer(config);
  const auto result = discoverer.Discover(timeout);
  if (!result.ok()) {
    std::cerr << "Discovery failed (" << result.strategy << "): "
              << result.error.ToString() << std::endl;
    return 2;
  }
  std::cout << "Found speaker at " << result.address->ToString() << " via "
            << result.strategy << std::endl;
  return 0;
}
