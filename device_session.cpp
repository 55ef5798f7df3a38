//
//  device_session.cpp
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

#include <algorithm>
#include <cmath>
#include <iterator>
#include <thread>

#include "capture.hpp"
#include "device_session.hpp"
#include "log.hpp"
#include "utils.hpp"

using namespace std::chrono_literals;

const char *to_string(CaptureOutcome outcome) {
  switch (outcome) {
  case CaptureOutcome::none:
    return "none";
  case CaptureOutcome::completed:
    return "completed";
  case CaptureOutcome::timeout:
    return "timeout";
  case CaptureOutcome::empty_capture:
    return "empty capture";
  case CaptureOutcome::stream_error:
    return "stream error";
  case CaptureOutcome::stopped:
    return "stopped";
  }
  return "unknown";
}

DeviceSession::DeviceSession(const Config &config,
                             std::unique_ptr<AudioSource> source,
                             std::shared_ptr<SpeechOracle> oracle)
    : config_(config), format_(config.get_audio_format()),
      timeout_(config.get_timeout()), source_(std::move(source)),
      threshold_(config_),
      classifier_(format_, threshold_, std::move(oracle),
                  static_cast<size_t>(config.get_sample_rate()) *
                      std::max(0, config.get_vad_frame_ms()) / 1000),
      segmenter_(config_, classifier_) {}

DeviceSession::~DeviceSession() { stop_stream(); }

std::unique_ptr<DeviceSession>
DeviceSession::open(const Config &config, std::unique_ptr<AudioSource> source,
                    std::shared_ptr<SpeechOracle> oracle, DeviceError &error) {
  auto session = std::make_unique<DeviceSession>(config, std::move(source),
                                                 std::move(oracle));
  if (!session->start_stream()) {
    error = session->get_last_error();
    return nullptr;
  }
  error = DeviceError::none;
  return session;
}

std::vector<DeviceInfo> DeviceSession::list_devices(const Config &config) {
  return Capture::list_devices(config.get_quiet());
}

bool DeviceSession::start_stream() {
  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (running_)
    return true;

  if (source_ == nullptr) {
    BOOST_LOG_TRIVIAL(error) << "session:: no audio source";
    last_error_ = DeviceError::device_unavailable;
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "session:: starting audio stream from "
                          << source_->describe() << " ... ";

  if (!source_->is_open()) {
    auto err = source_->open(format_, config_.get_chunk_size());
    if (err != DeviceError::none) {
      BOOST_LOG_TRIVIAL(error) << "session:: cannot open "
                               << source_->describe() << ": "
                               << to_string(err);
      source_->close();
      last_error_ = err;
      return false;
    }
    threshold_.reset();
  }

  if (!source_->start()) {
    BOOST_LOG_TRIVIAL(error) << "session:: cannot start "
                             << source_->describe();
    source_->close();
    last_error_ = DeviceError::device_open_failed;
    return false;
  }

  store_.clear();
  leftover_.clear();
  store_.set_capacity(source_->is_live() ? backlog_frames() : 0);
  next_sequence_ = 0;
  stop_requested_ = false;
  producer_eos_ = false;
  producer_error_ = false;
  last_error_ = DeviceError::none;
  running_ = true;

  if (!config_.get_push_mode())
    return true;

  /* producer only hands frames over, segmentation stays on the caller */
  producer_ = std::async(std::launch::async, [this]() {
    BOOST_LOG_TRIVIAL(debug) << "session:: producer loop start";
    std::vector<uint8_t> buffer;
    uint64_t rejected = 0;
    bool ret = true;
    while (!stop_requested_) {
      auto status = source_->read(buffer, poll_interval);
      if (status == ReadStatus::ok) {
        if (!store_.push(AudioFrame{buffer, next_sequence_++})) {
          if (rejected++ == 0) {
            BOOST_LOG_TRIVIAL(warning) << "session:: frame store full, "
                                       << "dropping frames";
          }
        }
      } else if (status == ReadStatus::end_of_stream) {
        BOOST_LOG_TRIVIAL(info) << "session:: end of stream";
        producer_eos_ = true;
        break;
      } else if (status == ReadStatus::error) {
        BOOST_LOG_TRIVIAL(error) << "session:: stream read error";
        producer_error_ = true;
        ret = false;
        break;
      }
    }
    BOOST_LOG_TRIVIAL(debug) << "session:: producer loop end, "
                             << next_sequence_ << " frames";
    return ret;
  });

  return true;
}

void DeviceSession::request_stop() { stop_requested_ = true; }

void DeviceSession::stop_stream() {
  request_stop();
  std::lock_guard<std::mutex> capture_lock(capture_mutex_);
  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (producer_.valid()) {
    if (!producer_.get()) {
      BOOST_LOG_TRIVIAL(debug) << "session:: producer ended with an error";
    }
  }
  if (source_ != nullptr && source_->is_open()) {
    BOOST_LOG_TRIVIAL(info) << "session:: stopping audio stream ... ";
    source_->close();
  }
  running_ = false;
}

size_t DeviceSession::backlog_frames() const {
  if (config_.get_chunk_size() == 0)
    return 0;
  double seconds = static_cast<double>(max_backlog.count());
  return static_cast<size_t>(std::ceil(seconds * config_.get_sample_rate() /
                                       config_.get_chunk_size()));
}

size_t DeviceSession::frames_for(std::optional<double> duration) const {
  if (!duration || *duration <= 0 || config_.get_chunk_size() == 0)
    return 0;
  auto frames = std::floor(*duration * config_.get_sample_rate() /
                           config_.get_chunk_size());
  return std::max<size_t>(1, static_cast<size_t>(frames));
}

bool DeviceSession::expired(std::chrono::steady_clock::time_point start) const {
  return std::chrono::steady_clock::now() - start > timeout_;
}

std::optional<Utterance> DeviceSession::capture(std::optional<double> duration,
                                                bool wait_for_speech) {
  std::lock_guard<std::mutex> lock(capture_mutex_);
  TimeElapsed elapsed("session:: capture");

  if (stop_requested_) {
    last_outcome_ = CaptureOutcome::stopped;
    return std::nullopt;
  }

  if (running_ && producer_error_) {
    BOOST_LOG_TRIVIAL(warning) << "session:: restarting failed stream";
    {
      std::lock_guard<std::mutex> stream_lock(stream_mutex_);
      if (producer_.valid()) {
        producer_.get();
      }
      source_->close();
      running_ = false;
    }
  }

  auto max_frames = frames_for(duration);
  if (running_) {
    /* live audio older than this call is not part of it, a replayed
       recording is consumed from where the last capture stopped */
    if (source_->is_live()) {
      store_.clear();
      leftover_.clear();
    }
  } else if (!start_stream()) {
    last_outcome_ = CaptureOutcome::stream_error;
    return std::nullopt;
  }

  BOOST_LOG_TRIVIAL(debug) << "session:: capture"
                           << (wait_for_speech ? " waiting for speech" : "")
                           << (max_frames ? ", max frames " : "")
                           << (max_frames ? std::to_string(max_frames) : "");

  auto start = std::chrono::steady_clock::now();
  segmenter_.begin(wait_for_speech, max_frames);
  last_outcome_ = CaptureOutcome::none;

  if (config_.get_push_mode()) {
    run_push(start);
  } else {
    run_pull(start);
  }

  auto utterance = segmenter_.take_utterance();
  switch (segmenter_.get_state()) {
  case Segmenter::State::completed:
    last_outcome_ = CaptureOutcome::completed;
    break;
  case Segmenter::State::timed_out:
    last_outcome_ = CaptureOutcome::timeout;
    break;
  default:
    if (last_outcome_ == CaptureOutcome::none) {
      last_outcome_ = CaptureOutcome::stream_error;
    }
    break;
  }
  /* a stream ending mid utterance still yields what was captured */
  if (last_outcome_ == CaptureOutcome::empty_capture && utterance) {
    last_outcome_ = CaptureOutcome::completed;
  }

  if (utterance) {
    BOOST_LOG_TRIVIAL(info) << "session:: " << to_string(last_outcome_)
                            << ", utterance of " << utterance->frames
                            << " frames from frame "
                            << utterance->first_sequence;
  } else {
    BOOST_LOG_TRIVIAL(debug) << "session:: " << to_string(last_outcome_)
                             << ", no speech captured";
  }
  return utterance;
}

void DeviceSession::run_push(std::chrono::steady_clock::time_point start) {
  while (!segmenter_.is_done()) {
    if (stop_requested_) {
      last_outcome_ = CaptureOutcome::stopped;
      segmenter_.fail();
      break;
    }

    /* sample the producer state before draining so no frame is missed */
    bool eos = producer_eos_;
    bool error = producer_error_;
    std::vector<AudioFrame> frames;
    frames.swap(leftover_);
    if (frames.empty()) {
      frames = store_.drain_available();
    }
    size_t next = 0;
    while (next < frames.size() && !segmenter_.is_done()) {
      if (expired(start)) {
        segmenter_.expire();
        break;
      }
      segmenter_.feed(std::move(frames[next++]));
    }
    if (segmenter_.is_done()) {
      /* drained but not consumed, first in line for the next capture */
      leftover_.assign(std::make_move_iterator(frames.begin() + next),
                       std::make_move_iterator(frames.end()));
      break;
    }

    if (expired(start)) {
      BOOST_LOG_TRIVIAL(debug) << "session:: audio capture timeout";
      segmenter_.expire();
      break;
    }

    if (frames.empty()) {
      if (error) {
        last_outcome_ = CaptureOutcome::stream_error;
        last_error_ = DeviceError::stream_read_error;
        segmenter_.fail();
        break;
      }
      if (eos) {
        last_outcome_ = CaptureOutcome::empty_capture;
        segmenter_.fail();
        break;
      }
      std::this_thread::sleep_for(poll_interval);
    }
  }
}

void DeviceSession::run_pull(std::chrono::steady_clock::time_point start) {
  std::vector<uint8_t> buffer;
  while (!segmenter_.is_done()) {
    if (stop_requested_) {
      last_outcome_ = CaptureOutcome::stopped;
      segmenter_.fail();
      break;
    }

    auto remaining = timeout_ - (std::chrono::steady_clock::now() - start);
    if (remaining <= 0s) {
      BOOST_LOG_TRIVIAL(debug) << "session:: audio capture timeout";
      segmenter_.expire();
      break;
    }
    auto wait = std::min(
        poll_interval,
        std::chrono::duration_cast<std::chrono::milliseconds>(remaining) + 1ms);

    auto status = source_->read(buffer, wait);
    if (status == ReadStatus::ok) {
      if (expired(start)) {
        segmenter_.expire();
        break;
      }
      segmenter_.feed(AudioFrame{buffer, next_sequence_++});
    } else if (status == ReadStatus::end_of_stream) {
      last_outcome_ = CaptureOutcome::empty_capture;
      segmenter_.fail();
    } else if (status == ReadStatus::error) {
      BOOST_LOG_TRIVIAL(error) << "session:: error reading audio from "
                               << source_->describe();
      last_outcome_ = CaptureOutcome::stream_error;
      last_error_ = DeviceError::stream_read_error;
      segmenter_.fail();
    }
  }
}
