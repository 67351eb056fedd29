// Thread safety tests for concurrent controller readers and writers.
#include "kefctl/kefctl.h"

#include "fake_transport.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace {

// Alternates between two complete playback documents on every read.
class AlternatingTransport : public kefctl_test::FakeTransport {
 public:
  bool GetData(const kefctl::DeviceAddress& device,
               const std::string& path,
               const std::string& roles,
               nlohmann::json* out,
               kefctl::Error* error) override {
    if (path == kefctl::kPlayerDataPath) {
      const bool first = (reads_.fetch_add(1) % 2) == 0;
      *out = first ? kefctl_test::PlayerData("A", "playing")
                   : kefctl_test::PlayerData("B", "paused");
      return true;
    }
    return FakeTransport::GetData(device, path, roles, out, error);
  }

 private:
  std::atomic<int> reads_{0};
};

kefctl::PlaybackInfo Expected(const std::string& title, const std::string& state) {
  kefctl::PlaybackInfo info;
  info.title = title;
  info.artist = "Artist " + title;
  info.album = "Album " + title;
  info.album_art = "http://speaker/art/" + title + ".jpg";
  info.duration = 215000;
  info.state = state;
  return info;
}

}  // namespace

TEST(ThreadSafetyTest, ReadersNeverSeeTornPlayback) {
  auto transport = std::make_shared<AlternatingTransport>();
  kefctl::Config config;
  config.device_address = "192.168.1.37";
  config.log_callback = [](kefctl::LogLevel, const std::string&) {};
  kefctl::Controller controller(config, transport);

  const auto a = Expected("A", "playing");
  const auto b = Expected("B", "paused");
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::vector<std::thread> readers;
  for (int i = 0; i < 3; ++i) {
    readers.emplace_back([&]() {
      while (!done.load()) {
        const auto state = controller.GetState();
        if (state.playback.has_value() && !(state.playback.value() == a) &&
            !(state.playback.value() == b)) {
          torn.fetch_add(1);
        }
      }
    });
  }

  std::thread writer([&]() {
    for (int i = 0; i < 500; ++i) {
      EXPECT_TRUE(controller.RefreshPlaybackInfo().has_value());
    }
  });
  writer.join();
  done.store(true);
  for (auto& reader : readers) {
    reader.join();
  }

  EXPECT_EQ(torn.load(), 0);
}

TEST(ThreadSafetyTest, ConcurrentVolumeWritesStayInRange) {
  auto transport = std::make_shared<kefctl_test::FakeTransport>();
  kefctl::Config config;
  config.device_address = "192.168.1.37";
  config.log_callback = [](kefctl::LogLevel, const std::string&) {};
  kefctl::Controller controller(config, transport);

  std::thread up([&]() {
    for (int i = 0; i < 500; ++i) {
      EXPECT_TRUE(controller.VolumeStep(kefctl::VolumeDirection::kUp));
    }
  });
  std::thread down([&]() {
    for (int i = 0; i < 500; ++i) {
      EXPECT_TRUE(controller.VolumeStep(kefctl::VolumeDirection::kDown));
    }
  });
  std::thread absolute([&]() {
    for (int i = 0; i < 500; ++i) {
      EXPECT_TRUE(controller.SetVolume(i % 150));
    }
  });
  std::thread reader([&]() {
    for (int i = 0; i < 2000; ++i) {
      const int volume = controller.GetState().volume;
      EXPECT_GE(volume, kefctl::kMinVolume);
      EXPECT_LE(volume, kefctl::kMaxVolume);
    }
  });

  up.join();
  down.join();
  absolute.join();
  reader.join();

  EXPECT_EQ(controller.GetMetrics().commands_sent, 1500u);
}
