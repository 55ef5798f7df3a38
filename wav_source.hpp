//
//  wav_source.hpp
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

#ifndef _WAV_SOURCE_HPP_
#define _WAV_SOURCE_HPP_

#include <string>
#include <vector>

#include "audio_source.hpp"

/* Replays a WAV file as if it came from a capture device.
   With realtime set each frame is paced to its duration. */
class WavFileSource : public AudioSource {
public:
  explicit WavFileSource(const std::string &path, bool realtime = false)
      : path_(path), realtime_(realtime){};

  DeviceError open(const AudioFormat &format, uint32_t chunk_size) override;
  bool start() override;
  ReadStatus read(std::vector<uint8_t> &out,
                  std::chrono::milliseconds timeout) override;
  void close() override;
  bool is_open() const override { return open_; }
  bool is_live() const override { return realtime_; }
  std::string describe() const override { return "file:" + path_; }

private:
  std::string path_;
  bool realtime_;
  bool open_{false};
  std::vector<uint8_t> pcm_;
  size_t offset_{0};
  size_t chunk_bytes_{0};
  std::chrono::microseconds frame_period_{0};
  std::chrono::steady_clock::time_point next_frame_;
};

#endif
