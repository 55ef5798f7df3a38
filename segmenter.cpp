//
//  segmenter.cpp
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

#include "log.hpp"
#include "segmenter.hpp"

/* absorbs binary rounding of values like 0.1 / 0.064 */
static constexpr double epsilon = 1e-9;

const char *to_string(Segmenter::State state) {
  switch (state) {
  case Segmenter::State::idle:
    return "idle";
  case Segmenter::State::waiting_for_speech:
    return "waiting_for_speech";
  case Segmenter::State::capturing:
    return "capturing";
  case Segmenter::State::completed:
    return "completed";
  case Segmenter::State::timed_out:
    return "timed_out";
  case Segmenter::State::error:
    return "error";
  }
  return "unknown";
}

Segmenter::Segmenter(const Config &config, FrameClassifier &classifier)
    : frame_duration_(config.get_frame_duration()),
      speech_pad_end_(config.get_speech_pad_end()), pad_frames_(0),
      onset_frames_(1), classifier_(classifier) {
  if (frame_duration_ > 0) {
    auto pad = config.get_speech_pad_start() / frame_duration_;
    pad_frames_ = pad > 0 ? static_cast<size_t>(std::floor(pad + epsilon)) : 0;
    auto onset = config.get_min_speech_duration() / frame_duration_;
    if (onset > 0) {
      onset_frames_ = std::max<size_t>(
          1, static_cast<size_t>(std::ceil(onset - epsilon)));
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "segmenter:: frame duration " << frame_duration_
                           << "s, lead-in " << pad_frames_
                           << " frames, onset " << onset_frames_ << " frames";
}

void Segmenter::begin(bool wait_for_speech, size_t max_frames) {
  pending_.clear();
  onset_.clear();
  accumulated_.clear();
  /* without waiting the capture runs as if speech had just been heard */
  has_speech_started_ = !wait_for_speech;
  consecutive_silence_frames_ = 0;
  frames_since_start_ = 0;
  max_frames_ = max_frames;
  /* a fixed length recording is only ended by its frame cap */
  endpointing_ = wait_for_speech || max_frames == 0;
  state_ = wait_for_speech ? State::waiting_for_speech : State::capturing;
}

bool Segmenter::is_done() const {
  return state_ == State::completed || state_ == State::timed_out ||
         state_ == State::error;
}

Segmenter::State Segmenter::feed(AudioFrame frame) {
  if (state_ == State::idle || is_done()) {
    return state_;
  }

  frames_since_start_++;
  auto cls = classifier_.classify(frame);

  if (state_ == State::waiting_for_speech) {
    if (cls == FrameClass::speech) {
      onset_.push_back(std::move(frame));
      if (onset_.size() >= onset_frames_) {
        start_capture();
      }
    } else {
      for (auto &onset : onset_) {
        push_pending(std::move(onset));
      }
      onset_.clear();
      push_pending(std::move(frame));
    }
  } else {
    accumulated_.push_back(std::move(frame));
    if (cls == FrameClass::speech) {
      has_speech_started_ = true;
      consecutive_silence_frames_ = 0;
    } else {
      consecutive_silence_frames_++;
    }
  }

  if (state_ == State::capturing) {
    if (max_frames_ > 0 && accumulated_.size() >= max_frames_) {
      BOOST_LOG_TRIVIAL(debug) << "segmenter:: frame limit " << max_frames_
                               << " reached";
      state_ = State::completed;
    } else if (endpointing_ && silence_exceeded()) {
      BOOST_LOG_TRIVIAL(debug)
          << "segmenter:: silence detected after speech ("
          << consecutive_silence_frames_ * frame_duration_ << "s)";
      state_ = State::completed;
    }
  }
  return state_;
}

void Segmenter::push_pending(AudioFrame frame) {
  if (pad_frames_ == 0)
    return;
  pending_.push_back(std::move(frame));
  while (pending_.size() > pad_frames_) {
    pending_.pop_front();
  }
}

void Segmenter::start_capture() {
  BOOST_LOG_TRIVIAL(debug) << "segmenter:: speech detected at frame "
                           << onset_.front().sequence << ", lead-in "
                           << pending_.size() << " frames";
  accumulated_.reserve(pending_.size() + onset_.size());
  std::move(pending_.begin(), pending_.end(), std::back_inserter(accumulated_));
  std::move(onset_.begin(), onset_.end(), std::back_inserter(accumulated_));
  pending_.clear();
  onset_.clear();
  has_speech_started_ = true;
  consecutive_silence_frames_ = 0;
  state_ = State::capturing;
}

bool Segmenter::silence_exceeded() const {
  return has_speech_started_ &&
         consecutive_silence_frames_ * frame_duration_ > speech_pad_end_ + epsilon;
}

Segmenter::State Segmenter::expire() {
  if (!is_done() && state_ != State::idle) {
    state_ = State::timed_out;
  }
  return state_;
}

Segmenter::State Segmenter::fail() {
  if (!is_done() && state_ != State::idle) {
    state_ = State::error;
  }
  return state_;
}

std::optional<Utterance> Segmenter::take_utterance() {
  if (accumulated_.empty()) {
    return std::nullopt;
  }

  Utterance utterance;
  utterance.first_sequence = accumulated_.front().sequence;
  utterance.frames = accumulated_.size();
  size_t bytes = 0;
  for (const auto &frame : accumulated_) {
    bytes += frame.data.size();
  }
  utterance.pcm.reserve(bytes);
  for (const auto &frame : accumulated_) {
    utterance.pcm.insert(utterance.pcm.end(), frame.data.begin(),
                         frame.data.end());
  }
  accumulated_.clear();
  return utterance;
}
