//
//  frame_store.hpp
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

#ifndef _FRAME_STORE_HPP_
#define _FRAME_STORE_HPP_

#include <atomic>
#include <deque>
#include <mutex>
#include <vector>

#include "audio_format.hpp"

/* FIFO hand-off between the device producer and the segmenter.
   A capacity of 0 means unbounded. */
class FrameStore {
public:
  explicit FrameStore(size_t capacity = 0) : capacity_(capacity){};
  FrameStore(const FrameStore &) = delete;

  bool push(AudioFrame frame);
  std::vector<AudioFrame> drain_available();
  void clear();

  void set_capacity(size_t capacity);
  size_t size() const;
  uint64_t overruns() const { return overruns_.load(); }

private:
  mutable std::mutex mutex_;
  std::deque<AudioFrame> frames_;
  size_t capacity_;
  std::atomic<uint64_t> overruns_{0};
};

#endif
