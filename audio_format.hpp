//
//  audio_format.hpp
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

#ifndef _AUDIO_FORMAT_HPP_
#define _AUDIO_FORMAT_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class SampleFormat { int16, float32 };

std::optional<SampleFormat> parse_sample_format(const std::string &name);
const char *to_string(SampleFormat format);

struct AudioFormat {
  uint32_t sample_rate{16000};
  uint8_t channels{1};
  SampleFormat format{SampleFormat::int16};

  size_t bytes_per_sample() const {
    return format == SampleFormat::float32 ? 4 : 2;
  }
  size_t bytes_per_frame() const { return bytes_per_sample() * channels; }
};

/* one chunk of interleaved samples as delivered by the device */
struct AudioFrame {
  std::vector<uint8_t> data;
  uint64_t sequence{0};
};

/* contiguous speech segment handed to the recognizers */
struct Utterance {
  std::vector<uint8_t> pcm;
  uint64_t first_sequence{0};
  size_t frames{0};
};

/* RMS in int16 units, float32 samples are scaled by 32768.
   Returns false for empty, misaligned or non-finite input. */
bool frame_rms(const uint8_t *data, size_t bytes, const AudioFormat &format,
               double &rms);

/* channels averaged, samples normalized to [-1, 1] */
bool decode_mono(const uint8_t *data, size_t bytes, const AudioFormat &format,
                 std::vector<float> &out);

#endif
