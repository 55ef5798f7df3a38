//
//  frame_store_test.cpp
//
//  Copyright (c) 2019 2025 Andrea Bondavalli. All rights reserved.
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the MIT license
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//

#include <atomic>
#include <gtest/gtest.h>
#include <thread>

#include "frame_store.hpp"

static AudioFrame numbered(uint64_t seq) {
  return AudioFrame{std::vector<uint8_t>{static_cast<uint8_t>(seq & 0xff), 0},
                    seq};
}

TEST(FrameStore, DrainReturnsFramesInPushOrder) {
  FrameStore store;
  for (uint64_t i = 0; i < 5; i++) {
    ASSERT_TRUE(store.push(numbered(i)));
  }
  EXPECT_EQ(store.size(), 5u);

  auto frames = store.drain_available();
  ASSERT_EQ(frames.size(), 5u);
  for (uint64_t i = 0; i < 5; i++) {
    EXPECT_EQ(frames[i].sequence, i);
  }
  EXPECT_EQ(store.size(), 0u);
  EXPECT_TRUE(store.drain_available().empty());
}

TEST(FrameStore, ClearDropsPendingFrames) {
  FrameStore store;
  store.push(numbered(0));
  store.push(numbered(1));
  store.clear();
  EXPECT_EQ(store.size(), 0u);

  store.push(numbered(2));
  auto frames = store.drain_available();
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].sequence, 2u);
}

TEST(FrameStore, FullStoreRejectsNewFrames) {
  FrameStore store(2);
  EXPECT_TRUE(store.push(numbered(0)));
  EXPECT_TRUE(store.push(numbered(1)));
  EXPECT_FALSE(store.push(numbered(2)));
  EXPECT_EQ(store.overruns(), 1u);

  auto frames = store.drain_available();
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[1].sequence, 1u);

  /* room again after draining */
  EXPECT_TRUE(store.push(numbered(3)));
}

TEST(FrameStore, CapacityCanBeLifted) {
  FrameStore store(1);
  store.push(numbered(0));
  EXPECT_FALSE(store.push(numbered(1)));
  store.set_capacity(0);
  EXPECT_TRUE(store.push(numbered(2)));
  EXPECT_EQ(store.size(), 2u);
}

TEST(FrameStore, ConcurrentProducerKeepsOrder) {
  static constexpr uint64_t total = 5000;
  FrameStore store;
  std::thread producer([&store]() {
    for (uint64_t i = 0; i < total; i++) {
      store.push(numbered(i));
    }
  });

  std::vector<uint64_t> seen;
  while (seen.size() < total) {
    for (auto &frame : store.drain_available()) {
      seen.push_back(frame.sequence);
    }
    std::this_thread::yield();
  }
  producer.join();

  ASSERT_EQ(seen.size(), total);
  for (uint64_t i = 0; i < total; i++) {
    ASSERT_EQ(seen[i], i);
  }
}

TEST(FrameStore, ClearRacingProducerNeverResurrectsFrames) {
  FrameStore store;
  std::atomic_bool stop{false};
  std::atomic<uint64_t> pushed{0};
  std::thread producer([&]() {
    uint64_t seq = 0;
    while (!stop) {
      store.push(numbered(seq++));
      pushed = seq;
    }
  });

  /* let a backlog build up, then drop it while the producer keeps going */
  std::vector<uint64_t> before;
  while (before.size() < 100) {
    for (auto &frame : store.drain_available()) {
      before.push_back(frame.sequence);
    }
  }
  while (store.size() < 50) {
    std::this_thread::yield();
  }
  store.clear();

  std::vector<uint64_t> after;
  while (after.size() < 1000) {
    for (auto &frame : store.drain_available()) {
      after.push_back(frame.sequence);
    }
  }
  stop = true;
  producer.join();
  for (auto &frame : store.drain_available()) {
    after.push_back(frame.sequence);
  }

  ASSERT_FALSE(after.empty());
  /* everything up to the clear is gone, the rest arrives complete and in
     order up to the last pushed frame */
  EXPECT_GT(after.front(), before.back() + 1);
  for (size_t i = 1; i < after.size(); i++) {
    ASSERT_EQ(after[i], after[i - 1] + 1);
  }
  EXPECT_EQ(after.back(), pushed.load() - 1);
}
