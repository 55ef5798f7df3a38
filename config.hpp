//
//  config.hpp
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

#ifndef _CONFIG_HPP_
#define _CONFIG_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "audio_format.hpp"

class Config {
 public:
  /* audio */
  uint32_t get_sample_rate() const { return sample_rate_; }
  uint8_t get_channels() const { return channels_; }
  SampleFormat get_format() const { return format_; }
  uint32_t get_chunk_size() const { return chunk_size_; }
  float get_silence_threshold() const { return silence_threshold_; }
  bool get_dynamic_silence() const { return dynamic_silence_; }
  float get_min_speech_duration() const { return min_speech_duration_; }
  float get_speech_pad_start() const { return speech_pad_start_; }
  float get_speech_pad_end() const { return speech_pad_end_; }
  const std::optional<int>& get_device_index() const { return device_index_; }
  const std::string& get_device_name() const { return device_name_; };
  float get_timeout() const { return timeout_; }
  bool get_push_mode() const { return push_mode_; }
  bool get_quiet() const { return quiet_; }

  /* voice activity oracle */
  bool get_vad_enabled() const { return vad_enabled_; };
  int get_vad_mode() const { return vad_mode_; }
  int get_vad_frame_ms() const { return vad_frame_ms_; }
  const std::string& get_vad_model() const { return vad_model_; };
  float get_vad_threshold() const { return vad_threshold_; };

  /* recognition */
  const std::string& get_engine() const { return engine_; }
  const std::string& get_fallback_engine() const { return fallback_engine_; }
  const std::string& get_model() const { return model_; }
  const std::string& get_language() const { return language_; }
  const std::string& get_openvino_device() const { return openvino_device_; }
  int get_beam_size() const { return beam_size_; }
  int get_threads() const { return threads_; }
  bool get_use_context() const { return use_context_; };

  int get_log_severity() const { return log_severity_; };

  AudioFormat get_audio_format() const {
    return AudioFormat{sample_rate_, channels_, format_};
  }

  /* seconds covered by one chunk_size frame */
  double get_frame_duration() const {
    return sample_rate_ ? static_cast<double>(chunk_size_) / sample_rate_ : 0;
  }

  /* device name resolved from device_index when one is set */
  std::string get_capture_device() const {
    if (device_index_) {
      return "plughw:" + std::to_string(*device_index_);
    }
    return device_name_;
  }

  void set_sample_rate(uint32_t sample_rate) { sample_rate_ = sample_rate; };
  void set_channels(uint8_t channels) { channels_ = channels; }
  void set_format(SampleFormat format) { format_ = format; }
  void set_chunk_size(uint32_t chunk_size) { chunk_size_ = chunk_size; }
  void set_silence_threshold(float silence_threshold) {
    silence_threshold_ = silence_threshold;
  }
  void set_dynamic_silence(bool dynamic_silence) {
    dynamic_silence_ = dynamic_silence;
  }
  void set_min_speech_duration(float min_speech_duration) {
    min_speech_duration_ = min_speech_duration;
  }
  void set_speech_pad_start(float speech_pad_start) {
    speech_pad_start_ = speech_pad_start;
  }
  void set_speech_pad_end(float speech_pad_end) {
    speech_pad_end_ = speech_pad_end;
  }
  void set_device_index(std::optional<int> device_index) {
    device_index_ = device_index;
  }
  void set_device_name(std::string_view device_name) {
    device_name_ = device_name;
  };
  void set_timeout(float timeout) { timeout_ = timeout; }
  void set_push_mode(bool push_mode) { push_mode_ = push_mode; }
  void set_quiet(bool quiet) { quiet_ = quiet; }

  void set_vad_enabled(bool vad_enabled) { vad_enabled_ = vad_enabled; };
  void set_vad_mode(int vad_mode) { vad_mode_ = vad_mode; }
  void set_vad_frame_ms(int vad_frame_ms) { vad_frame_ms_ = vad_frame_ms; }
  void set_vad_model(const std::string& vad_model) { vad_model_ = vad_model; };
  void set_vad_threshold(float vad_threshold) {
    vad_threshold_ = vad_threshold;
  };

  void set_engine(const std::string& engine) { engine_ = engine; }
  void set_fallback_engine(const std::string& fallback_engine) {
    fallback_engine_ = fallback_engine;
  }
  void set_model(const std::string& model) { model_ = model; }
  void set_language(const std::string& language) { language_ = language; }
  void set_openvino_device(const std::string& openvino_device) {
    openvino_device_ = openvino_device;
  }
  void set_beam_size(int beam_size) { beam_size_ = beam_size; }
  void set_threads(int threads) { threads_ = threads; }
  void set_use_context(bool use_context) { use_context_ = use_context; };

  void set_log_severity(int log_severity) { log_severity_ = log_severity; };

 private:
  uint32_t sample_rate_{16000};
  uint8_t channels_{1};
  SampleFormat format_{SampleFormat::int16};
  uint32_t chunk_size_{1024};
  float silence_threshold_{300};
  bool dynamic_silence_{true};
  float min_speech_duration_{0.05f};
  float speech_pad_start_{0.1f};
  float speech_pad_end_{0.2f};
  std::optional<int> device_index_;
  std::string device_name_{"default"};
  float timeout_{2.0f};
  bool push_mode_{true};
  bool quiet_{true};

  bool vad_enabled_{false};
  int vad_mode_{1};
  int vad_frame_ms_{30};
  std::string vad_model_{"./models/ggml-silero-v5.1.2.bin"};
  /* negative: derive from vad_mode */
  float vad_threshold_{-1.0f};

  std::string engine_{"whisper"};
  std::string fallback_engine_;
  std::string model_{"./models/ggml-base.en.bin"};
  std::string language_{"en"};
  std::string openvino_device_{"CPU"};
  int beam_size_{5};
  int threads_{4};
  bool use_context_{false};

  int log_severity_{2};
};

#endif
