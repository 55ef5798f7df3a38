//
//  wav_file.cpp
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
#include <cstring>
#include <fstream>
#include <iterator>

#include "log.hpp"
#include "wav_file.hpp"

static constexpr uint16_t wav_format_pcm = 1;
static constexpr uint16_t wav_format_float = 3;

static void put_tag(std::vector<uint8_t> &out, const char *tag) {
  out.insert(out.end(), tag, tag + 4);
}

static void put_u16(std::vector<uint8_t> &out, uint16_t value) {
  out.push_back(value & 0xff);
  out.push_back((value >> 8) & 0xff);
}

static void put_u32(std::vector<uint8_t> &out, uint32_t value) {
  out.push_back(value & 0xff);
  out.push_back((value >> 8) & 0xff);
  out.push_back((value >> 16) & 0xff);
  out.push_back((value >> 24) & 0xff);
}

static uint16_t get_u16(const uint8_t *in) { return in[0] | (in[1] << 8); }

static uint32_t get_u32(const uint8_t *in) {
  return static_cast<uint32_t>(in[0]) | (static_cast<uint32_t>(in[1]) << 8) |
         (static_cast<uint32_t>(in[2]) << 16) |
         (static_cast<uint32_t>(in[3]) << 24);
}

std::vector<uint8_t> encode_wav(const std::vector<uint8_t> &pcm,
                                const AudioFormat &format) {
  auto data_size = static_cast<uint32_t>(pcm.size());
  auto block_align = static_cast<uint16_t>(format.bytes_per_frame());
  auto bits = static_cast<uint16_t>(format.bytes_per_sample() * 8);

  std::vector<uint8_t> out;
  out.reserve(wav_header_size + pcm.size());
  put_tag(out, "RIFF");
  put_u32(out, 36 + data_size);
  put_tag(out, "WAVE");
  put_tag(out, "fmt ");
  put_u32(out, 16);
  put_u16(out, format.format == SampleFormat::float32 ? wav_format_float
                                                      : wav_format_pcm);
  put_u16(out, format.channels);
  put_u32(out, format.sample_rate);
  put_u32(out, format.sample_rate * block_align);
  put_u16(out, block_align);
  put_u16(out, bits);
  put_tag(out, "data");
  put_u32(out, data_size);
  out.insert(out.end(), pcm.begin(), pcm.end());
  return out;
}

bool write_wav(const std::string &path, const std::vector<uint8_t> &pcm,
               const AudioFormat &format) {
  if (pcm.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "wav:: nothing to write to " << path;
    return false;
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "wav:: cannot create " << path;
    return false;
  }

  auto bytes = encode_wav(pcm, format);
  file.write(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "wav:: write error on " << path;
    return false;
  }
  return true;
}

bool decode_wav(const std::vector<uint8_t> &bytes, AudioFormat &format,
                std::vector<uint8_t> &pcm) {
  if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
      std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
    BOOST_LOG_TRIVIAL(error) << "wav:: invalid RIFF/WAVE signature";
    return false;
  }

  bool have_fmt = false;
  size_t offset = 12;
  while (offset + 8 <= bytes.size()) {
    const uint8_t *chunk = bytes.data() + offset;
    uint32_t chunk_size = get_u32(chunk + 4);
    size_t body = offset + 8;

    if (std::memcmp(chunk, "fmt ", 4) == 0) {
      if (chunk_size < 16 || body + 16 > bytes.size()) {
        BOOST_LOG_TRIVIAL(error) << "wav:: truncated fmt chunk";
        return false;
      }
      uint16_t audio_format = get_u16(chunk + 8);
      uint16_t channels = get_u16(chunk + 10);
      uint32_t rate = get_u32(chunk + 12);
      uint16_t bits = get_u16(chunk + 22);

      if (audio_format == wav_format_pcm && bits == 16) {
        format.format = SampleFormat::int16;
      } else if (audio_format == wav_format_float && bits == 32) {
        format.format = SampleFormat::float32;
      } else {
        BOOST_LOG_TRIVIAL(error) << "wav:: unsupported encoding "
                                 << audio_format << "/" << bits << " bits";
        return false;
      }
      if (channels == 0 || channels > 255 || rate == 0) {
        BOOST_LOG_TRIVIAL(error) << "wav:: invalid fmt chunk";
        return false;
      }
      format.channels = static_cast<uint8_t>(channels);
      format.sample_rate = rate;
      have_fmt = true;
    } else if (std::memcmp(chunk, "data", 4) == 0) {
      if (!have_fmt) {
        BOOST_LOG_TRIVIAL(error) << "wav:: data chunk before fmt chunk";
        return false;
      }
      /* tolerate writers that left the size unset or too large */
      size_t available = bytes.size() - body;
      size_t size = std::min<size_t>(chunk_size, available);
      size -= size % format.bytes_per_frame();
      pcm.assign(bytes.begin() + body, bytes.begin() + body + size);
      return true;
    }

    /* chunks are word aligned */
    offset = body + chunk_size + (chunk_size & 1);
  }

  BOOST_LOG_TRIVIAL(error) << "wav:: no data chunk found";
  return false;
}

bool read_wav(const std::string &path, AudioFormat &format,
              std::vector<uint8_t> &pcm) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "wav:: cannot open " << path;
    return false;
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  return decode_wav(bytes, format, pcm);
}
