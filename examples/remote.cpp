// Interactive terminal remote: volume, track skip and play/pause from the keyboard.
#include "kefctl/kefctl.h"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace {

const char* kColorReset = "\033[0m";
const char* kColorBold = "\033[1m";
const char* kColorGreen = "\033[32m";
const char* kColorYellow = "\033[33m";
const char* kColorCyan = "\033[36m";
const char* kColorRed = "\033[31m";

void ClearScreen() {
  std::cout << "\033[2J\033[H";
}

void PrintHeader() {
  std::cout << kColorBold << kColorCyan;
  std::cout << "╔══════════════════════════════════════════╗\n";
  std::cout << "║          KEF Speaker Remote              ║\n";
  std::cout << "╚══════════════════════════════════════════╝\n";
  std::cout << kColorReset << "\n";
}

void PrintState(const kefctl::Controller& controller) {
  const auto state = controller.GetState();
  std::cout << kColorBold << "Speaker:\n" << kColorReset;
  std::cout << "─────────────────────────────────────\n";
  std::cout << kColorYellow << "Address: " << kColorReset << state.address << ":"
            << state.port << "\n";
  std::cout << kColorYellow << "Model:   " << kColorReset
            << (state.model.empty() ? "unknown" : state.model) << "\n";
  std::cout << kColorYellow << "Status:  " << kColorReset
            << (state.connected ? "connected" : "disconnected") << "\n";
  std::cout << kColorYellow << "Volume:  " << kColorReset << state.volume << "\n";
  if (state.playback.has_value()) {
    const auto& playback = state.playback.value();
    std::cout << kColorYellow << "Playing: " << kColorReset << playback.title;
    if (!playback.artist.empty()) {
      std::cout << " - " << playback.artist;
    }
    std::cout << " [" << playback.state << "]\n";
  }
  if (!state.last_error.empty()) {
    std::cout << kColorRed << "Last error: " << state.last_error << kColorReset << "\n";
  }
  std::cout << "\n";
}

void PrintMenu() {
  std::cout << kColorBold << "Keys:\n" << kColorReset;
  std::cout << "  +  Volume up        -  Volume down\n";
  std::cout << "  v  Set volume       p  Play/pause\n";
  std::cout << "  n  Next track       b  Previous track\n";
  std::cout << "  r  Refresh          q  Quit\n\n";
  std::cout << kColorBold << "Enter choice: " << kColorReset;
}

void Report(bool ok, const kefctl::Error& error, const std::string& done) {
  if (ok) {
    std::cout << kColorGreen << "✓ " << done << "\n" << kColorReset;
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
  } else {
    std::cout << kColorRed << "Error: " << error.ToString() << "\n" << kColorReset;
    std::this_thread::sleep_for(std::chrono::seconds(2));
  }
}

void HandleSetVolume(kefctl::Controller& controller) {
  std::cout << "\nEnter volume (0-100): ";
  std::string text;
  std::getline(std::cin, text);
  kefctl::Error error;
  const bool ok = controller.SetVolumeFromText(text, &error);
  Report(ok, error, "Volume set to " + std::to_string(controller.GetState().volume));
}

kefctl::DeviceAddress Discover() {
  std::cout << "No address given, searching the network...\n";
  kefctl::Discoverer discoverer;
  const auto result = discoverer.Discover(std::chrono::seconds(10));
  if (!result.ok()) {
    std::cerr << "Discovery failed: " << result.error.ToString() << "\n";
    return {};
  }
  std::cout << "Found speaker at " << result.address->ToString() << "\n";
  return result.address.value();
}

}  // namespace

int main(int argc, char** argv) {
  kefctl::Config config;
  if (argc > 1) {
    config.device_address = argv[1];
  }
  if (argc > 2) {
    config.volume_step = std::atoi(argv[2]);
  }
  config.log_callback = [](kefctl::LogLevel level, const std::string& message) {
    if (level != kefctl::LogLevel::kInfo) {
      std::cerr << "\n[" << kefctl::LogLevelName(level) << "] " << message << "\n";
    }
  };

  std::string config_error;
  if (!config.Validate(&config_error)) {
    std::cerr << "Configuration error: " << config_error << "\n";
    std::cout << "Usage: kefctl_remote [speaker_ip] [volume_step]\n";
    return 1;
  }

  kefctl::Controller controller(config);
  if (config.device_address.empty()) {
    const auto address = Discover();
    if (address.empty()) {
      return 1;
    }
    controller.SetAddress(address);
  }

  kefctl::Error error;
  if (!controller.Connect(&error)) {
    std::cerr << "Failed to connect: " << error.ToString() << "\n";
    return 1;
  }
  if (!controller.RefreshPlaybackInfo(&error)) {
    std::cerr << "Could not read playback info: " << error.ToString() << "\n";
  }

  bool running = true;
  while (running) {
    ClearScreen();
    PrintHeader();
    PrintState(controller);
    PrintMenu();

    std::string choice;
    if (!std::getline(std::cin, choice)) {
      break;
    }
    if (choice.empty()) {
      continue;
    }

    error = kefctl::Error{};
    switch (choice[0]) {
      case '+':
      case '-': {
        const auto direction = choice[0] == '+' ? kefctl::VolumeDirection::kUp
                                                : kefctl::VolumeDirection::kDown;
        const bool ok = controller.VolumeStep(direction, &error);
        Report(ok, error, "Volume " + std::to_string(controller.GetState().volume));
        break;
      }
      case 'v':
      case 'V':
        HandleSetVolume(controller);
        break;
      case 'p':
      case 'P':
        {
          const bool was_playing = controller.IsPlaying();
          Report(controller.PlayPause(&error), error, was_playing ? "Pausing" : "Playing");
        }
        break;
      case 'n':
      case 'N':
        Report(controller.NextTrack(&error), error, "Next track");
        break;
      case 'b':
      case 'B':
        Report(controller.PreviousTrack(&error), error, "Previous track");
        break;
      case 'r':
      case 'R':
        if (!controller.GetVolume(&error) || !controller.RefreshPlaybackInfo(&error)) {
          Report(false, error, "");
        }
        break;
      case 'q':
      case 'Q':
        running = false;
        break;
      default:
        std::cout << kColorRed << "Invalid choice.\n" << kColorReset;
        std::this_thread::sleep_for(std::chrono::seconds(1));
        break;
    }
  }

  std::cout << "\n" << kColorYellow << "Closing connection...\n" << kColorReset;
  controller.Close();
  const auto metrics = controller.GetMetrics();
  std::cout << "Commands sent: " << metrics.commands_sent
            << ", polls: " << metrics.polls
            << ", poll failures: " << metrics.poll_failures << "\n";
  return 0;
}
