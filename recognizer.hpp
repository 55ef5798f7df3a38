//
//  recognizer.hpp
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

#ifndef _RECOGNIZER_HPP_
#define _RECOGNIZER_HPP_

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "audio_format.hpp"
#include "config.hpp"

/* speech to text backend consuming finished utterances */
class Recognizer {
public:
  virtual ~Recognizer() = default;

  virtual std::string name() const = 0;
  virtual bool available() const = 0;
  /* nullopt when nothing was recognized or the backend failed */
  virtual std::optional<std::string> recognize(const Utterance &utterance,
                                               const AudioFormat &format) = 0;
};

/* name -> constructor table, filled explicitly at startup */
class RecognizerRegistry {
public:
  using Factory = std::function<std::unique_ptr<Recognizer>(const Config &)>;

  static RecognizerRegistry builtin();

  void add(const std::string &name, Factory factory);
  bool contains(const std::string &name) const;
  std::vector<std::string> names() const;

  /* nullptr when unknown, failing to build or not available */
  std::unique_ptr<Recognizer> create(const std::string &name,
                                     const Config &config) const;
  /* first backend of the list that can be used */
  std::unique_ptr<Recognizer> select(const std::vector<std::string> &priority,
                                     const Config &config) const;

private:
  std::map<std::string, Factory> factories_;
};

#endif
