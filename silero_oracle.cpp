//
//  silero_oracle.cpp
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
#include <whisper.h>

#include "log.hpp"
#include "silero_oracle.hpp"

float SileroOracle::threshold_for_mode(int mode) {
  static const float thresholds[] = {0.35f, 0.5f, 0.65f, 0.8f};
  return thresholds[std::clamp(mode, 0, 3)];
}

std::shared_ptr<SileroOracle> SileroOracle::create(const Config &config) {
  if (config.get_sample_rate() != WHISPER_SAMPLE_RATE) {
    BOOST_LOG_TRIVIAL(warning) << "oracle:: silero requires "
                               << WHISPER_SAMPLE_RATE << " Hz, got "
                               << config.get_sample_rate();
    return nullptr;
  }

  auto params = whisper_vad_default_context_params();
  params.n_threads = std::max(1, config.get_threads());
  params.use_gpu = false;

  auto ctx = whisper_vad_init_from_file_with_params(
      config.get_vad_model().c_str(), params);
  if (ctx == nullptr) {
    BOOST_LOG_TRIVIAL(error) << "oracle:: cannot load VAD model "
                             << config.get_vad_model();
    return nullptr;
  }

  float threshold = config.get_vad_threshold() >= 0
                        ? config.get_vad_threshold()
                        : threshold_for_mode(config.get_vad_mode());
  BOOST_LOG_TRIVIAL(info) << "oracle:: silero VAD loaded, threshold "
                          << threshold;
  return std::shared_ptr<SileroOracle>(new SileroOracle(ctx, threshold));
}

SileroOracle::~SileroOracle() {
  if (ctx_ != nullptr) {
    whisper_vad_free(ctx_);
    ctx_ = nullptr;
  }
}

bool SileroOracle::detect(const float *samples, size_t count, bool &speech) {
  if (ctx_ == nullptr || samples == nullptr || count == 0) {
    return false;
  }

  if (!whisper_vad_detect_speech(ctx_, samples, static_cast<int>(count))) {
    return false;
  }

  int n_probs = whisper_vad_n_probs(ctx_);
  const float *probs = whisper_vad_probs(ctx_);
  if (n_probs <= 0 || probs == nullptr) {
    return false;
  }

  speech = *std::max_element(probs, probs + n_probs) >= threshold_;
  return true;
}
