//
//  recognizer.cpp
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

#include <stdexcept>

#include "log.hpp"
#include "recognizer.hpp"
#include "whisper.hpp"

RecognizerRegistry RecognizerRegistry::builtin() {
  RecognizerRegistry registry;
  registry.add("whisper", [](const Config &config) -> std::unique_ptr<Recognizer> {
    return Whisper::create(config);
  });
  return registry;
}

void RecognizerRegistry::add(const std::string &name, Factory factory) {
  if (!factory) {
    throw std::invalid_argument("recognizer " + name + " has no factory");
  }
  if (!factories_.emplace(name, std::move(factory)).second) {
    throw std::invalid_argument("recognizer " + name + " already registered");
  }
}

bool RecognizerRegistry::contains(const std::string &name) const {
  return factories_.count(name) > 0;
}

std::vector<std::string> RecognizerRegistry::names() const {
  std::vector<std::string> out;
  for (const auto &entry : factories_) {
    out.push_back(entry.first);
  }
  return out;
}

std::unique_ptr<Recognizer>
RecognizerRegistry::create(const std::string &name,
                           const Config &config) const {
  auto it = factories_.find(name);
  if (it == factories_.end()) {
    BOOST_LOG_TRIVIAL(warning) << "recognizer:: engine '" << name
                               << "' not found";
    return nullptr;
  }

  std::unique_ptr<Recognizer> recognizer;
  try {
    recognizer = it->second(config);
  } catch (const std::exception &e) {
    BOOST_LOG_TRIVIAL(error) << "recognizer:: cannot create '" << name
                             << "': " << e.what();
    return nullptr;
  }

  if (recognizer == nullptr || !recognizer->available()) {
    BOOST_LOG_TRIVIAL(warning) << "recognizer:: engine '" << name
                               << "' not available";
    return nullptr;
  }
  return recognizer;
}

std::unique_ptr<Recognizer>
RecognizerRegistry::select(const std::vector<std::string> &priority,
                           const Config &config) const {
  for (const auto &name : priority) {
    if (name.empty())
      continue;
    if (auto recognizer = create(name, config)) {
      BOOST_LOG_TRIVIAL(info) << "recognizer:: using " << recognizer->name();
      return recognizer;
    }
  }
  BOOST_LOG_TRIVIAL(error) << "recognizer:: no speech recognition engine "
                              "available";
  return nullptr;
}
