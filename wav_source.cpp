//
//  wav_source.cpp
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
#include <thread>

#include "log.hpp"
#include "wav_file.hpp"
#include "wav_source.hpp"

DeviceError WavFileSource::open(const AudioFormat &format,
                                uint32_t chunk_size) {
  AudioFormat file_format;
  std::vector<uint8_t> pcm;
  if (!read_wav(path_, file_format, pcm)) {
    return DeviceError::device_unavailable;
  }

  if (file_format.sample_rate != format.sample_rate ||
      file_format.channels != format.channels ||
      file_format.format != format.format) {
    BOOST_LOG_TRIVIAL(error)
        << "wav_source:: " << path_ << " is " << file_format.sample_rate
        << " Hz " << (int)file_format.channels << " channels "
        << to_string(file_format.format) << ", expected "
        << format.sample_rate << " Hz " << (int)format.channels
        << " channels " << to_string(format.format);
    return DeviceError::device_open_failed;
  }

  pcm_ = std::move(pcm);
  offset_ = 0;
  chunk_bytes_ = static_cast<size_t>(chunk_size) * format.bytes_per_frame();
  frame_period_ = std::chrono::microseconds(
      static_cast<int64_t>(1e6 * chunk_size / format.sample_rate));
  open_ = true;
  BOOST_LOG_TRIVIAL(info) << "wav_source:: replaying " << path_ << " ("
                          << pcm_.size() / format.bytes_per_frame()
                          << " samples)";
  return DeviceError::none;
}

bool WavFileSource::start() {
  next_frame_ = std::chrono::steady_clock::now();
  return open_;
}

ReadStatus WavFileSource::read(std::vector<uint8_t> &out,
                               std::chrono::milliseconds timeout) {
  if (!open_) {
    return ReadStatus::error;
  }
  if (offset_ >= pcm_.size()) {
    return ReadStatus::end_of_stream;
  }

  if (realtime_) {
    auto now = std::chrono::steady_clock::now();
    if (next_frame_ > now) {
      if (next_frame_ - now > timeout) {
        std::this_thread::sleep_for(timeout);
        return ReadStatus::no_data;
      }
      std::this_thread::sleep_until(next_frame_);
    }
    next_frame_ += frame_period_;
  }

  auto size = std::min(chunk_bytes_, pcm_.size() - offset_);
  out.assign(pcm_.begin() + offset_, pcm_.begin() + offset_ + size);
  offset_ += size;
  return ReadStatus::ok;
}

void WavFileSource::close() {
  if (!open_)
    return;
  open_ = false;
  pcm_.clear();
  offset_ = 0;
}
