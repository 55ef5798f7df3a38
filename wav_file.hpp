//
//  wav_file.hpp
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

#ifndef _WAV_FILE_HPP_
#define _WAV_FILE_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "audio_format.hpp"

static constexpr size_t wav_header_size = 44;

/* canonical RIFF/WAVE: fmt chunk of 16 bytes (PCM or IEEE float) + data */
std::vector<uint8_t> encode_wav(const std::vector<uint8_t> &pcm,
                                const AudioFormat &format);
bool write_wav(const std::string &path, const std::vector<uint8_t> &pcm,
               const AudioFormat &format);

/* accepts any chunk order, unknown chunks are skipped */
bool decode_wav(const std::vector<uint8_t> &bytes, AudioFormat &format,
                std::vector<uint8_t> &pcm);
bool read_wav(const std::string &path, AudioFormat &format,
              std::vector<uint8_t> &pcm);

#endif
