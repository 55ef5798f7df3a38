//
//  device_session.hpp
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

#ifndef _DEVICE_SESSION_HPP_
#define _DEVICE_SESSION_HPP_

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "adaptive_threshold.hpp"
#include "audio_source.hpp"
#include "config.hpp"
#include "frame_classifier.hpp"
#include "frame_store.hpp"
#include "segmenter.hpp"

enum class CaptureOutcome {
  none,
  completed,
  timeout,
  empty_capture,
  stream_error,
  stopped
};

const char *to_string(CaptureOutcome outcome);

/*
 * Owns one audio source and turns its stream into utterances.
 *
 * In push mode a producer task reads the source and hands frames to the
 * FrameStore while capture() polls the store. In pull mode capture() reads
 * the source itself. Either way only one capture() runs at a time and the
 * source is closed exactly once, at the latest by the destructor.
 */
class DeviceSession {
public:
  DeviceSession(const Config &config, std::unique_ptr<AudioSource> source,
                std::shared_ptr<SpeechOracle> oracle = nullptr);
  DeviceSession(const DeviceSession &) = delete;
  DeviceSession &operator=(const DeviceSession &) = delete;
  ~DeviceSession();

  /* session with a started stream or nullptr with error set */
  static std::unique_ptr<DeviceSession>
  open(const Config &config, std::unique_ptr<AudioSource> source,
       std::shared_ptr<SpeechOracle> oracle, DeviceError &error);

  bool start_stream();
  void stop_stream();
  void request_stop();

  /* duration caps the utterance length, nullopt or <= 0 means no cap */
  std::optional<Utterance> capture(std::optional<double> duration = std::nullopt,
                                   bool wait_for_speech = true);

  static std::vector<DeviceInfo> list_devices(const Config &config);

  bool is_streaming() const { return running_.load(); }
  DeviceError get_last_error() const { return last_error_; }
  CaptureOutcome get_last_outcome() const { return last_outcome_; }
  const Config &get_config() const { return config_; }
  const FrameStore &get_store() const { return store_; }
  const AdaptiveThreshold &get_threshold() const { return threshold_; }

  static constexpr std::chrono::milliseconds poll_interval{10};
  /* audio a live stream may queue while nobody captures */
  static constexpr std::chrono::seconds max_backlog{30};

private:
  void run_push(std::chrono::steady_clock::time_point start);
  void run_pull(std::chrono::steady_clock::time_point start);
  bool expired(std::chrono::steady_clock::time_point start) const;
  size_t frames_for(std::optional<double> duration) const;
  size_t backlog_frames() const;

  const Config config_;
  const AudioFormat format_;
  const std::chrono::duration<double> timeout_;
  std::unique_ptr<AudioSource> source_;
  AdaptiveThreshold threshold_;
  FrameClassifier classifier_;
  Segmenter segmenter_;
  FrameStore store_;
  std::vector<AudioFrame> leftover_;

  std::mutex capture_mutex_;
  std::mutex stream_mutex_;
  std::future<bool> producer_;
  std::atomic_bool running_{false};
  std::atomic_bool stop_requested_{false};
  std::atomic_bool producer_eos_{false};
  std::atomic_bool producer_error_{false};
  uint64_t next_sequence_{0};

  DeviceError last_error_{DeviceError::none};
  CaptureOutcome last_outcome_{CaptureOutcome::none};
};

#endif
