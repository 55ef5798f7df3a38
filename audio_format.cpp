//
//  audio_format.cpp
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
#include <cmath>
#include <cstring>

#include "audio_format.hpp"

std::optional<SampleFormat> parse_sample_format(const std::string &name) {
  auto lower = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
  if (lower == "int16" || lower == "s16" || lower == "s16_le") {
    return SampleFormat::int16;
  }
  if (lower == "float32" || lower == "float" || lower == "float_le") {
    return SampleFormat::float32;
  }
  return std::nullopt;
}

const char *to_string(SampleFormat format) {
  switch (format) {
  case SampleFormat::int16:
    return "int16";
  case SampleFormat::float32:
    return "float32";
  }
  return "unknown";
}

static inline float load_sample(const uint8_t *in, SampleFormat format) {
  if (format == SampleFormat::float32) {
    uint32_t bits = static_cast<uint32_t>(in[0]) |
                    (static_cast<uint32_t>(in[1]) << 8) |
                    (static_cast<uint32_t>(in[2]) << 16) |
                    (static_cast<uint32_t>(in[3]) << 24);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
  }
  int16_t pcm = static_cast<int16_t>(in[0] | (in[1] << 8));
  return static_cast<float>(pcm) / 32768.0f;
}

bool frame_rms(const uint8_t *data, size_t bytes, const AudioFormat &format,
               double &rms) {
  auto sample_size = format.bytes_per_sample();
  if (data == nullptr || bytes == 0 || bytes % sample_size != 0) {
    return false;
  }

  size_t samples = bytes / sample_size;
  double acc = 0.0;
  for (size_t i = 0; i < samples; i++) {
    const uint8_t *in = data + i * sample_size;
    double value;
    if (format.format == SampleFormat::int16) {
      value = static_cast<int16_t>(in[0] | (in[1] << 8));
    } else {
      value = static_cast<double>(load_sample(in, format.format)) * 32768.0;
    }
    acc += value * value;
  }

  rms = std::sqrt(acc / static_cast<double>(samples));
  return std::isfinite(rms);
}

bool decode_mono(const uint8_t *data, size_t bytes, const AudioFormat &format,
                 std::vector<float> &out) {
  out.clear();
  auto frame_size = format.bytes_per_frame();
  if (data == nullptr || frame_size == 0 || bytes % frame_size != 0) {
    return false;
  }

  auto sample_size = format.bytes_per_sample();
  size_t frames = bytes / frame_size;
  out.reserve(frames);
  for (size_t offset = 0; offset < frames; offset++) {
    float pcmFloat{0};
    for (uint8_t ch = 0; ch < format.channels; ch++) {
      pcmFloat +=
          load_sample(data + offset * frame_size + ch * sample_size, format.format);
    }
    out.push_back(pcmFloat / format.channels);
  }
  return true;
}
