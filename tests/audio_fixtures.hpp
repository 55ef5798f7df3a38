//
//  audio_fixtures.hpp
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

#ifndef _AUDIO_FIXTURES_HPP_
#define _AUDIO_FIXTURES_HPP_

#include <atomic>
#include <chrono>
#include <functional>
#include <initializer_list>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

#include "audio_source.hpp"
#include "config.hpp"

static constexpr int16_t quiet_level = 100;
static constexpr int16_t speech_level = 5000;

/* int16 mono samples alternating +level/-level, RMS equals level */
inline std::vector<uint8_t> pcm16_frame(size_t samples, int16_t level) {
  std::vector<uint8_t> out;
  out.reserve(samples * 2);
  for (size_t i = 0; i < samples; i++) {
    int16_t value = (i & 1) ? -level : level;
    out.push_back(static_cast<uint16_t>(value) & 0xff);
    out.push_back((static_cast<uint16_t>(value) >> 8) & 0xff);
  }
  return out;
}

/* runs of {count, level} frames of chunk samples each */
inline std::vector<std::vector<uint8_t>>
frame_runs(std::initializer_list<std::pair<int, int16_t>> runs,
           size_t chunk = 1024) {
  std::vector<std::vector<uint8_t>> out;
  for (const auto &run : runs) {
    for (int i = 0; i < run.first; i++) {
      out.push_back(pcm16_frame(chunk, run.second));
    }
  }
  return out;
}

/* 16 kHz mono int16, 1024 samples per frame (64 ms) */
inline Config test_config() {
  Config config;
  config.set_sample_rate(16000);
  config.set_channels(1);
  config.set_format(SampleFormat::int16);
  config.set_chunk_size(1024);
  config.set_silence_threshold(300);
  config.set_dynamic_silence(true);
  config.set_min_speech_duration(0.05f);
  config.set_speech_pad_start(0.1f);
  config.set_speech_pad_end(0.2f);
  config.set_timeout(2.0f);
  return config;
}

struct SourceStats {
  std::atomic<int> opens{0};
  std::atomic<int> starts{0};
  std::atomic<int> closes{0};
  std::atomic<uint64_t> frames{0};
};

/*
 * AudioSource fed from memory. Either replays a fixed list of frames and
 * then keeps answering with tail, or generates frame n on demand every
 * pace milliseconds.
 */
class ScriptedSource : public AudioSource {
public:
  using Generator = std::function<std::vector<uint8_t>(uint64_t)>;

  explicit ScriptedSource(std::vector<std::vector<uint8_t>> frames,
                          ReadStatus tail = ReadStatus::end_of_stream)
      : frames_(std::move(frames)), tail_(tail){};
  ScriptedSource(Generator generator, std::chrono::milliseconds pace)
      : generator_(std::move(generator)), pace_(pace){};

  void fail_open(DeviceError error) { open_error_ = error; }
  std::shared_ptr<SourceStats> stats() const { return stats_; }

  DeviceError open(const AudioFormat &, uint32_t) override {
    stats_->opens++;
    if (open_error_ != DeviceError::none) {
      return open_error_;
    }
    open_ = true;
    return DeviceError::none;
  }

  bool start() override {
    stats_->starts++;
    return open_;
  }

  ReadStatus read(std::vector<uint8_t> &out,
                  std::chrono::milliseconds timeout) override {
    if (!open_) {
      return ReadStatus::error;
    }
    if (generator_) {
      std::this_thread::sleep_for(pace_);
      out = generator_(next_++);
      stats_->frames++;
      return ReadStatus::ok;
    }
    if (next_ < frames_.size()) {
      out = frames_[next_++];
      stats_->frames++;
      return ReadStatus::ok;
    }
    if (tail_ == ReadStatus::no_data) {
      std::this_thread::sleep_for(timeout);
    }
    return tail_;
  }

  void close() override {
    if (open_) {
      stats_->closes++;
    }
    open_ = false;
  }

  bool is_open() const override { return open_; }
  std::string describe() const override { return "scripted"; }

private:
  std::vector<std::vector<uint8_t>> frames_;
  ReadStatus tail_{ReadStatus::end_of_stream};
  Generator generator_;
  std::chrono::milliseconds pace_{0};
  size_t next_{0};
  std::atomic_bool open_{false};
  DeviceError open_error_{DeviceError::none};
  std::shared_ptr<SourceStats> stats_{std::make_shared<SourceStats>()};
};

#endif
