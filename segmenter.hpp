//
//  segmenter.hpp
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

#ifndef _SEGMENTER_HPP_
#define _SEGMENTER_HPP_

#include <deque>
#include <optional>
#include <vector>

#include "config.hpp"
#include "frame_classifier.hpp"

/*
 * Turns an ordered stream of frames into one utterance.
 *
 * While waiting for speech the last pad_frames silent frames are kept so the
 * utterance starts with some lead-in. Once a run of onset_frames speech
 * frames is seen the segmenter captures every frame until the trailing
 * silence exceeds speech_pad_end, max_frames is reached, or the caller
 * expires or fails the capture. Wall clock handling belongs to the caller.
 */
class Segmenter {
public:
  enum class State {
    idle,
    waiting_for_speech,
    capturing,
    completed,
    timed_out,
    error
  };

  Segmenter(const Config &config, FrameClassifier &classifier);
  Segmenter(const Segmenter &) = delete;

  /* max_frames 0 means no hard cap. Without wait_for_speech capture starts
     at once and, when a cap is set, runs to the cap whatever is heard. */
  void begin(bool wait_for_speech, size_t max_frames = 0);
  State feed(AudioFrame frame);
  State expire();
  State fail();

  State get_state() const { return state_; }
  bool is_done() const;
  bool has_speech_started() const { return has_speech_started_; }
  uint32_t get_consecutive_silence_frames() const {
    return consecutive_silence_frames_;
  }
  uint32_t get_frames_since_start() const { return frames_since_start_; }
  size_t get_pending_frames() const { return pending_.size() + onset_.size(); }
  size_t get_accumulated_frames() const { return accumulated_.size(); }
  size_t get_pad_frames() const { return pad_frames_; }
  size_t get_onset_frames() const { return onset_frames_; }

  /* concatenated capture, empty when speech never started */
  std::optional<Utterance> take_utterance();

private:
  void push_pending(AudioFrame frame);
  void start_capture();
  bool silence_exceeded() const;

  double frame_duration_;
  double speech_pad_end_;
  size_t pad_frames_;
  size_t onset_frames_;
  FrameClassifier &classifier_;

  State state_{State::idle};
  bool endpointing_{true};
  size_t max_frames_{0};
  bool has_speech_started_{false};
  uint32_t consecutive_silence_frames_{0};
  uint32_t frames_since_start_{0};
  std::deque<AudioFrame> pending_;
  std::vector<AudioFrame> onset_;
  std::vector<AudioFrame> accumulated_;
};

const char *to_string(Segmenter::State state);

#endif
