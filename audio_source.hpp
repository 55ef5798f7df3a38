//
//  audio_source.hpp
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

#ifndef _AUDIO_SOURCE_HPP_
#define _AUDIO_SOURCE_HPP_

#include <chrono>
#include <string>
#include <vector>

#include "audio_format.hpp"

enum class DeviceError {
  none,
  device_unavailable,
  device_open_failed,
  stream_read_error
};

const char *to_string(DeviceError error);

enum class ReadStatus { ok, no_data, end_of_stream, error };

struct DeviceInfo {
  int index;
  std::string name;
  unsigned channels;
  unsigned sample_rate;
};

/* Producer of fixed size frames. open() must release anything it acquired
   before reporting an error, close() may be called any number of times. */
class AudioSource {
public:
  virtual ~AudioSource() = default;

  virtual DeviceError open(const AudioFormat &format, uint32_t chunk_size) = 0;
  virtual bool start() = 0;
  /* waits at most timeout for one frame */
  virtual ReadStatus read(std::vector<uint8_t> &out,
                          std::chrono::milliseconds timeout) = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
  /* false for sources that can be read faster than real time */
  virtual bool is_live() const { return true; }
  virtual std::string describe() const = 0;
};

#endif
