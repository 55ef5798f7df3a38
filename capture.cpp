//
//  capture.cpp
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

#include <cerrno>
#include <cstdlib>

#include "capture.hpp"
#include "log.hpp"
#include "quiet.hpp"

DeviceError Capture::open(const AudioFormat &format, uint32_t chunk_size) {
  if (handle_ != nullptr) {
    BOOST_LOG_TRIVIAL(warning) << "capture:: " << device_name_
                               << " already open";
    return DeviceError::none;
  }
  if (chunk_size == 0 || format.channels == 0 || format.sample_rate == 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: invalid stream parameters";
    return DeviceError::device_open_failed;
  }

  int err;
  {
    QuietAudioScope quiet(quiet_);
    err = snd_pcm_open(&handle_, device_name_.c_str(), SND_PCM_STREAM_CAPTURE,
                       0);
  }
  if (err < 0) {
    handle_ = nullptr;
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot open device "
                             << device_name_ << ": " << snd_strerror(err);
    return (err == -ENOENT || err == -ENODEV || err == -ENXIO)
               ? DeviceError::device_unavailable
               : DeviceError::device_open_failed;
  }

  chunk_samples_ = chunk_size;
  if (!set_params(format)) {
    close();
    return DeviceError::device_open_failed;
  }

  bytes_per_frame_ = format.bytes_per_frame();
  overruns_ = 0;
  BOOST_LOG_TRIVIAL(info) << "capture:: opened " << device_name_ << " "
                          << rate_ << " Hz, " << (int)format.channels
                          << " channels, " << to_string(format.format)
                          << ", chunk " << chunk_samples_;
  return DeviceError::none;
}

bool Capture::set_params(const AudioFormat &format) {
  snd_pcm_hw_params_t *params;
  snd_pcm_hw_params_alloca(&params);

  int err = snd_pcm_hw_params_any(handle_, params);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: no configuration available: "
                             << snd_strerror(err);
    return false;
  }

  err = snd_pcm_hw_params_set_access(handle_, params,
                                     SND_PCM_ACCESS_RW_INTERLEAVED);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot set access type: "
                             << snd_strerror(err);
    return false;
  }

  auto pcm_format = format.format == SampleFormat::float32
                        ? SND_PCM_FORMAT_FLOAT_LE
                        : SND_PCM_FORMAT_S16_LE;
  err = snd_pcm_hw_params_set_format(handle_, params, pcm_format);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot set sample format "
                             << to_string(format.format) << ": "
                             << snd_strerror(err);
    return false;
  }

  err = snd_pcm_hw_params_set_channels(handle_, params, format.channels);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot set "
                             << (int)format.channels
                             << " channels: " << snd_strerror(err);
    return false;
  }

  unsigned int rate = format.sample_rate;
  err = snd_pcm_hw_params_set_rate_near(handle_, params, &rate, nullptr);
  if (err < 0 || rate != format.sample_rate) {
    BOOST_LOG_TRIVIAL(error) << "capture:: sample rate " << format.sample_rate
                             << " not supported (nearest " << rate << ")";
    return false;
  }
  rate_ = rate;

  snd_pcm_uframes_t period = chunk_samples_;
  err = snd_pcm_hw_params_set_period_size_near(handle_, params, &period,
                                               nullptr);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(warning) << "capture:: cannot set period size: "
                               << snd_strerror(err);
  }

  snd_pcm_uframes_t buffer_size = chunk_samples_ * 8;
  err = snd_pcm_hw_params_set_buffer_size_near(handle_, params, &buffer_size);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(warning) << "capture:: cannot set buffer size: "
                               << snd_strerror(err);
  }

  err = snd_pcm_hw_params(handle_, params);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot set parameters: "
                             << snd_strerror(err);
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "capture:: period " << period << " buffer "
                           << buffer_size;
  return true;
}

bool Capture::start() {
  if (handle_ == nullptr) {
    return false;
  }

  int err = snd_pcm_prepare(handle_);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot prepare device: "
                             << snd_strerror(err);
    return false;
  }
  err = snd_pcm_start(handle_);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot start device: "
                             << snd_strerror(err);
    return false;
  }
  return true;
}

ReadStatus Capture::read(std::vector<uint8_t> &out,
                         std::chrono::milliseconds timeout) {
  if (handle_ == nullptr) {
    return ReadStatus::error;
  }

  int err = snd_pcm_wait(handle_, static_cast<int>(timeout.count()));
  if (err == 0) {
    return ReadStatus::no_data;
  }
  if (err < 0) {
    if (err == -EPIPE) {
      overruns_++;
    }
    if (snd_pcm_recover(handle_, err, 1) < 0) {
      BOOST_LOG_TRIVIAL(error) << "capture:: wait failed: "
                               << snd_strerror(err);
      return ReadStatus::error;
    }
    return ReadStatus::no_data;
  }

  out.resize(chunk_samples_ * bytes_per_frame_);
  auto frames = snd_pcm_readi(handle_, out.data(), chunk_samples_);
  if (frames == -EAGAIN) {
    return ReadStatus::no_data;
  }
  if (frames < 0) {
    if (frames == -EPIPE) {
      overruns_++;
      BOOST_LOG_TRIVIAL(debug) << "capture:: overrun, recovering";
    }
    err = snd_pcm_recover(handle_, static_cast<int>(frames), 1);
    if (err < 0) {
      BOOST_LOG_TRIVIAL(error) << "capture:: read failed: "
                               << snd_strerror(static_cast<int>(frames));
      return ReadStatus::error;
    }
    return ReadStatus::no_data;
  }

  out.resize(static_cast<size_t>(frames) * bytes_per_frame_);
  return frames > 0 ? ReadStatus::ok : ReadStatus::no_data;
}

void Capture::close() {
  if (handle_ == nullptr)
    return;

  snd_pcm_drop(handle_);
  snd_pcm_close(handle_);
  handle_ = nullptr;
  BOOST_LOG_TRIVIAL(debug) << "capture:: closed " << device_name_;
}

std::vector<DeviceInfo> Capture::list_devices(bool quiet) {
  std::vector<DeviceInfo> devices;

  int card = -1;
  while (snd_card_next(&card) == 0 && card >= 0) {
    char *card_name = nullptr;
    std::string name = "card " + std::to_string(card);
    if (snd_card_get_name(card, &card_name) == 0 && card_name != nullptr) {
      name = card_name;
      std::free(card_name);
    }

    snd_pcm_t *pcm = nullptr;
    auto hw = "hw:" + std::to_string(card);
    int err;
    {
      QuietAudioScope silence(quiet);
      err = snd_pcm_open(&pcm, hw.c_str(), SND_PCM_STREAM_CAPTURE,
                         SND_PCM_NONBLOCK);
    }
    if (err < 0) {
      /* playback only card */
      continue;
    }

    snd_pcm_hw_params_t *params;
    snd_pcm_hw_params_alloca(&params);
    unsigned int channels = 0;
    unsigned int rate = 0;
    if (snd_pcm_hw_params_any(pcm, params) >= 0) {
      snd_pcm_hw_params_get_channels_max(params, &channels);
      for (unsigned int preferred : {48000u, 44100u, 16000u}) {
        if (snd_pcm_hw_params_test_rate(pcm, params, preferred, 0) == 0) {
          rate = preferred;
          break;
        }
      }
      if (rate == 0) {
        snd_pcm_hw_params_get_rate_max(params, &rate, nullptr);
      }
    }
    snd_pcm_close(pcm);

    if (channels > 0) {
      devices.push_back(DeviceInfo{card, name, channels, rate});
    }
  }
  return devices;
}
