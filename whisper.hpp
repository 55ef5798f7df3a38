//
//  whisper.hpp
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

#ifndef _WHISPER_HPP_
#define _WHISPER_HPP_

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <whisper.h>

#include "config.hpp"
#include "recognizer.hpp"

/* local whisper.cpp recognizer */
class Whisper : public Recognizer {
public:
  static std::unique_ptr<Whisper> create(const Config &config);
  Whisper(const Whisper &) = delete;
  ~Whisper() override;

  std::string name() const override { return "whisper"; }
  bool available() const override { return ctx_ != nullptr; }
  std::optional<std::string> recognize(const Utterance &utterance,
                                       const AudioFormat &format) override;

  bool transcribe(const float *in, uint32_t samples_in, std::string &out);

protected:
  explicit Whisper(const Config &config);

private:
  bool init();
  std::string to_timestamp(int64_t t, bool comma = false);

  std::string model_;
  std::string language_;
  std::string openvino_device_;
  int beam_size_;
  int threads_;
  bool use_context_;
  std::vector<whisper_token> prompt_tokens_;
  std::mutex mutex_;
  struct whisper_context *ctx_{nullptr};
};

#endif
