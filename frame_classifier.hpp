//
//  frame_classifier.hpp
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

#ifndef _FRAME_CLASSIFIER_HPP_
#define _FRAME_CLASSIFIER_HPP_

#include <memory>
#include <vector>

#include "adaptive_threshold.hpp"
#include "audio_format.hpp"

enum class FrameClass { silence, speech };

const char *to_string(FrameClass cls);

/* Frame level speech detector. detect() returns false when the
   detector itself failed and speech is left untouched. */
class SpeechOracle {
public:
  virtual ~SpeechOracle() = default;
  virtual bool detect(const float *samples, size_t count, bool &speech) = 0;
};

/* With an oracle the frame is speech when any oracle_window samples long
   window of it is. A window of 0 hands the whole frame over. */
class FrameClassifier {
public:
  FrameClassifier(const AudioFormat &format, AdaptiveThreshold &threshold,
                  std::shared_ptr<SpeechOracle> oracle = nullptr,
                  size_t oracle_window = 0)
      : format_(format), threshold_(threshold), oracle_(std::move(oracle)),
        oracle_window_(oracle_window){};
  FrameClassifier(const FrameClassifier &) = delete;

  FrameClass classify(const AudioFrame &frame);

  bool has_oracle() const { return oracle_ != nullptr; }
  uint64_t oracle_failures() const { return oracle_failures_; }

private:
  FrameClass classify_energy(double rms);
  bool ask_oracle(bool &speech);

  AudioFormat format_;
  AdaptiveThreshold &threshold_;
  std::shared_ptr<SpeechOracle> oracle_;
  size_t oracle_window_;
  std::vector<float> mono_;
  uint64_t oracle_failures_{0};
};

#endif
