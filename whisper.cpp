//
//  whisper.cpp
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

#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <cstdio>
#include <sstream>

#include "log.hpp"
#include "utils.hpp"
#include "whisper.hpp"

std::unique_ptr<Whisper> Whisper::create(const Config &config) {
  auto ptr = std::unique_ptr<Whisper>(new Whisper(config));
  if (!ptr->init()) {
    return nullptr;
  }
  return ptr;
}

Whisper::Whisper(const Config &config)
    : model_(config.get_model()), language_(config.get_language()),
      openvino_device_(config.get_openvino_device()),
      beam_size_(config.get_beam_size()),
      threads_(std::max(1, config.get_threads())),
      use_context_(config.get_use_context()) {}

Whisper::~Whisper() {
  if (ctx_ != nullptr) {
    BOOST_LOG_TRIVIAL(debug) << "whisper:: releasing model";
    whisper_free(ctx_);
    ctx_ = nullptr;
  }
}

bool Whisper::init() {
  BOOST_LOG_TRIVIAL(info) << "whisper:: loading model " << model_;
  if (language_ != "auto" && whisper_lang_id(language_.c_str()) == -1) {
    BOOST_LOG_TRIVIAL(error) << "whisper:: unknown language " << language_;
    return false;
  }

  struct whisper_context_params cparams = whisper_context_default_params();
  ctx_ = whisper_init_from_file_with_params(model_.c_str(), cparams);
  if (ctx_ == nullptr) {
    BOOST_LOG_TRIVIAL(error) << "whisper:: failed to initialize context from "
                             << model_;
    return false;
  }

  if (!whisper_is_multilingual(ctx_) && language_ != "en") {
    BOOST_LOG_TRIVIAL(warning) << "whisper:: model is not multilingual, "
                               << "ignoring language " << language_;
    language_ = "en";
  }

  // initialize openvino encoder, no effect on builds without it
  whisper_ctx_init_openvino_encoder(ctx_, nullptr, openvino_device_.c_str(),
                                    nullptr);

  BOOST_LOG_TRIVIAL(info) << "whisper:: system info "
                          << whisper_print_system_info();
  return true;
}

std::string Whisper::to_timestamp(int64_t t, bool comma) {
  // t is in 10 ms units
  int64_t msec = t * 10;
  int64_t hr = msec / (1000 * 60 * 60);
  msec = msec - hr * (1000 * 60 * 60);
  int64_t min = msec / (1000 * 60);
  msec = msec - min * (1000 * 60);
  int64_t sec = msec / 1000;
  msec = msec - sec * 1000;

  char buf[32];
  snprintf(buf, sizeof(buf), "%02d:%02d:%02d%s%03d", (int)hr, (int)min,
           (int)sec, comma ? "," : ".", (int)msec);
  return std::string(buf);
}

bool Whisper::transcribe(const float *in, uint32_t samples_in,
                         std::string &out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ctx_ == nullptr) {
    return false;
  }
  TimeElapsed elapsed("whisper:: transcribe");

  auto wparams = whisper_full_default_params(
      beam_size_ > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY);
  wparams.print_progress = false;
  wparams.print_special = false;
  wparams.print_realtime = false;
  wparams.print_timestamps = false;
  wparams.translate = false;
  wparams.single_segment = false;
  wparams.no_context = !use_context_;
  wparams.language = language_.c_str();
  wparams.n_threads = threads_;
  wparams.beam_search.beam_size = beam_size_;
  if (use_context_) {
    wparams.prompt_tokens = prompt_tokens_.empty() ? nullptr : prompt_tokens_.data();
    wparams.prompt_n_tokens = static_cast<int>(prompt_tokens_.size());
  }

  if (whisper_full(ctx_, wparams, in, static_cast<int>(samples_in)) != 0) {
    BOOST_LOG_TRIVIAL(error) << "whisper:: failed to process audio";
    return false;
  }

  std::stringstream text;
  const int n_segments = whisper_full_n_segments(ctx_);
  for (int i = 0; i < n_segments; ++i) {
    const char *segment = whisper_full_get_segment_text(ctx_, i);
    BOOST_LOG_TRIVIAL(debug)
        << "whisper:: [" << to_timestamp(whisper_full_get_segment_t0(ctx_, i))
        << " --> " << to_timestamp(whisper_full_get_segment_t1(ctx_, i))
        << "] " << segment;
    text << segment;
  }

  if (use_context_) {
    prompt_tokens_.clear();
    for (int i = 0; i < n_segments; ++i) {
      const int token_count = whisper_full_n_tokens(ctx_, i);
      for (int j = 0; j < token_count; ++j) {
        prompt_tokens_.push_back(whisper_full_get_token_id(ctx_, i, j));
      }
    }
  }

  out = boost::algorithm::trim_copy(text.str());
  return true;
}

std::optional<std::string> Whisper::recognize(const Utterance &utterance,
                                              const AudioFormat &format) {
  if (format.sample_rate != WHISPER_SAMPLE_RATE) {
    BOOST_LOG_TRIVIAL(error) << "whisper:: requires " << WHISPER_SAMPLE_RATE
                             << " Hz audio, got " << format.sample_rate;
    return std::nullopt;
  }

  std::vector<float> samples;
  if (!decode_mono(utterance.pcm.data(), utterance.pcm.size(), format,
                   samples) ||
      samples.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "whisper:: cannot decode utterance of "
                               << utterance.pcm.size() << " bytes";
    return std::nullopt;
  }

  std::string text;
  if (!transcribe(samples.data(), static_cast<uint32_t>(samples.size()),
                  text) ||
      text.empty()) {
    return std::nullopt;
  }
  return text;
}
