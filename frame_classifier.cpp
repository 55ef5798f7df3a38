//
//  frame_classifier.cpp
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

#include "frame_classifier.hpp"
#include "log.hpp"

const char *to_string(FrameClass cls) {
  return cls == FrameClass::speech ? "speech" : "silence";
}

FrameClass FrameClassifier::classify(const AudioFrame &frame) {
  double rms{0};
  if (!frame_rms(frame.data.data(), frame.data.size(), format_, rms)) {
    BOOST_LOG_TRIVIAL(warning) << "classifier:: malformed frame "
                               << frame.sequence << " (" << frame.data.size()
                               << " bytes), treating as silence";
    return FrameClass::silence;
  }

  if (oracle_ &&
      decode_mono(frame.data.data(), frame.data.size(), format_, mono_)) {
    bool speech{false};
    if (ask_oracle(speech)) {
      if (!speech && rms <= threshold_.current()) {
        /* keep the fallback floor tracking the room */
        threshold_.observe(rms);
      }
      return speech ? FrameClass::speech : FrameClass::silence;
    }
    oracle_failures_++;
    BOOST_LOG_TRIVIAL(debug) << "classifier:: oracle failed on frame "
                             << frame.sequence << ", using energy";
  }

  return classify_energy(rms);
}

bool FrameClassifier::ask_oracle(bool &speech) {
  size_t window = mono_.size();
  if (oracle_window_ > 0 && oracle_window_ < window) {
    window = oracle_window_;
  }

  speech = false;
  for (size_t pos = 0; pos < mono_.size() && !speech; pos += window) {
    auto count = std::min(window, mono_.size() - pos);
    if (!oracle_->detect(mono_.data() + pos, count, speech)) {
      return false;
    }
  }
  return true;
}

FrameClass FrameClassifier::classify_energy(double rms) {
  if (rms > threshold_.current()) {
    return FrameClass::speech;
  }
  threshold_.observe(rms);
  return FrameClass::silence;
}
