//
//  frame_store.cpp
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

#include <iterator>

#include "frame_store.hpp"
#include "log.hpp"

bool FrameStore::push(AudioFrame frame) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (capacity_ > 0 && frames_.size() >= capacity_) {
    overruns_++;
    return false;
  }
  frames_.push_back(std::move(frame));
  return true;
}

std::vector<AudioFrame> FrameStore::drain_available() {
  std::vector<AudioFrame> out;
  std::lock_guard<std::mutex> lock(mutex_);
  out.reserve(frames_.size());
  std::move(frames_.begin(), frames_.end(), std::back_inserter(out));
  frames_.clear();
  return out;
}

void FrameStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!frames_.empty()) {
    BOOST_LOG_TRIVIAL(trace) << "store:: dropping " << frames_.size()
                             << " stale frames";
  }
  frames_.clear();
}

void FrameStore::set_capacity(size_t capacity) {
  std::lock_guard<std::mutex> lock(mutex_);
  capacity_ = capacity;
}

size_t FrameStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frames_.size();
}
