//
//  capture.hpp
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

#ifndef _CAPTURE_HPP_
#define _CAPTURE_HPP_

#include <alsa/asoundlib.h>
#include <string>
#include <vector>

#include "audio_source.hpp"

/* ALSA PCM capture device */
class Capture : public AudioSource {
public:
  explicit Capture(const std::string &device_name, bool quiet = true)
      : device_name_(device_name), quiet_(quiet){};
  Capture(const Capture &) = delete;
  ~Capture() override { close(); }

  DeviceError open(const AudioFormat &format, uint32_t chunk_size) override;
  bool start() override;
  ReadStatus read(std::vector<uint8_t> &out,
                  std::chrono::milliseconds timeout) override;
  void close() override;
  bool is_open() const override { return handle_ != nullptr; }
  std::string describe() const override { return "alsa:" + device_name_; }

  size_t get_bytes_per_frame() const { return bytes_per_frame_; }
  snd_pcm_uframes_t get_chunk_samples() const { return chunk_samples_; }
  uint32_t get_rate() const { return rate_; }
  uint64_t get_overruns() const { return overruns_; }

  static std::vector<DeviceInfo> list_devices(bool quiet = true);

private:
  bool set_params(const AudioFormat &format);

  std::string device_name_;
  bool quiet_;
  snd_pcm_t *handle_{nullptr};
  snd_pcm_uframes_t chunk_samples_{0};
  size_t bytes_per_frame_{0};
  uint32_t rate_{0};
  uint64_t overruns_{0};
};

#endif
