//
//  silero_oracle.hpp
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

#ifndef _SILERO_ORACLE_HPP_
#define _SILERO_ORACLE_HPP_

#include <memory>
#include <string>

#include "config.hpp"
#include "frame_classifier.hpp"

struct whisper_vad_context;

/* Silero VAD as shipped with whisper.cpp */
class SileroOracle : public SpeechOracle {
public:
  static std::shared_ptr<SileroOracle> create(const Config &config);
  SileroOracle(const SileroOracle &) = delete;
  ~SileroOracle() override;

  bool detect(const float *samples, size_t count, bool &speech) override;

  float get_threshold() const { return threshold_; }

  /* probability threshold for a vad_mode aggressiveness in 0-3 */
  static float threshold_for_mode(int mode);

protected:
  SileroOracle(whisper_vad_context *ctx, float threshold)
      : ctx_(ctx), threshold_(threshold){};

private:
  whisper_vad_context *ctx_{nullptr};
  float threshold_;
};

#endif
