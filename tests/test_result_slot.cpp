// Tests for the first-result-wins handoff.
#include "kefctl/result_slot.h"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

namespace {

using Slot = kefctl::ResultSlot<std::string>;
using Clock = std::chrono::steady_clock;

}  // namespace

TEST(ResultSlotTest, FirstOfferWins) {
  Slot slot;
  EXPECT_TRUE(slot.Offer("10.0.0.1"));
  EXPECT_FALSE(slot.Offer("10.0.0.2"));
  EXPECT_TRUE(slot.Settled());

  std::string value;
  EXPECT_EQ(slot.WaitUntil(Clock::now(), nullptr, &value), Slot::Outcome::kValue);
  EXPECT_EQ(value, "10.0.0.1");
}

TEST(ResultSlotTest, ExhaustedWhenAllProducersFinishEmpty) {
  Slot slot;
  std::vector<std::thread> producers;
  for (int i = 0; i < 4; ++i) {
    slot.AddProducer();
    producers.emplace_back([&slot]() { slot.ProducerDone(); });
  }
  slot.Seal();
  std::string value;
  EXPECT_EQ(slot.WaitUntil(Clock::now() + std::chrono::seconds(5), nullptr, &value),
            Slot::Outcome::kExhausted);
  for (auto& producer : producers) {
    producer.join();
  }
}

TEST(ResultSlotTest, NotExhaustedBeforeSeal) {
  Slot slot;
  std::string value;
  EXPECT_EQ(slot.WaitUntil(Clock::now() + std::chrono::milliseconds(60), nullptr, &value),
            Slot::Outcome::kTimeout);
}

TEST(ResultSlotTest, TimesOutWhileProducersRun) {
  Slot slot;
  slot.AddProducer();
  slot.Seal();
  const auto start = Clock::now();
  std::string value;
  EXPECT_EQ(slot.WaitUntil(start + std::chrono::milliseconds(100), nullptr, &value),
            Slot::Outcome::kTimeout);
  EXPECT_GE(Clock::now() - start, std::chrono::milliseconds(100));
}

TEST(ResultSlotTest, ExternalCancelFlagIsObserved) {
  Slot slot;
  slot.AddProducer();
  slot.Seal();
  std::atomic<bool> cancel{false};
  std::thread canceller([&cancel]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel.store(true);
  });
  const auto start = Clock::now();
  std::string value;
  EXPECT_EQ(slot.WaitUntil(start + std::chrono::seconds(5), &cancel, &value),
            Slot::Outcome::kCancelled);
  EXPECT_LT(Clock::now() - start, std::chrono::seconds(1));
  canceller.join();
}

TEST(ResultSlotTest, CancelRefusesLaterOffers) {
  Slot slot;
  slot.Cancel();
  EXPECT_FALSE(slot.Offer("10.0.0.1"));
  std::string value;
  EXPECT_EQ(slot.WaitUntil(Clock::now() + std::chrono::seconds(1), nullptr, &value),
            Slot::Outcome::kCancelled);
}

TEST(ResultSlotTest, ConcurrentOffersKeepOneValue) {
  Slot slot;
  std::atomic<int> winners{0};
  std::vector<std::thread> producers;
  for (int i = 0; i < 16; ++i) {
    slot.AddProducer();
    producers.emplace_back([&slot, &winners, i]() {
      if (slot.Offer("10.0.0." + std::to_string(i))) {
        winners.fetch_add(1);
      }
      slot.ProducerDone();
    });
  }
  slot.Seal();
  std::string value;
  EXPECT_EQ(slot.WaitUntil(Clock::now() + std::chrono::seconds(5), nullptr, &value),
            Slot::Outcome::kValue);
  for (auto& producer : producers) {
    producer.join();
  }
  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(value.rfind("10.0.0.", 0), 0u);
}
