//
//  recognizer_test.cpp
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

#include <gtest/gtest.h>
#include <stdexcept>

#include "recognizer.hpp"

namespace {

class EchoRecognizer : public Recognizer {
public:
  EchoRecognizer(std::string name, bool available)
      : name_(std::move(name)), available_(available){};

  std::string name() const override { return name_; }
  bool available() const override { return available_; }
  std::optional<std::string> recognize(const Utterance &utterance,
                                       const AudioFormat &) override {
    return name_ + ":" + std::to_string(utterance.frames);
  }

private:
  std::string name_;
  bool available_;
};

RecognizerRegistry::Factory echo(const std::string &name, bool available) {
  return [name, available](const Config &) -> std::unique_ptr<Recognizer> {
    return std::make_unique<EchoRecognizer>(name, available);
  };
}

RecognizerRegistry fake_registry() {
  RecognizerRegistry registry;
  registry.add("offline", echo("offline", false));
  registry.add("local", echo("local", true));
  registry.add("remote", echo("remote", true));
  registry.add("broken", [](const Config &) -> std::unique_ptr<Recognizer> {
    throw std::runtime_error("no credentials");
  });
  registry.add("null", [](const Config &) -> std::unique_ptr<Recognizer> {
    return nullptr;
  });
  return registry;
}

} // namespace

TEST(RecognizerRegistry, BuiltinKnowsWhisper) {
  auto registry = RecognizerRegistry::builtin();
  EXPECT_TRUE(registry.contains("whisper"));
  EXPECT_FALSE(registry.contains("sphinx"));
}

TEST(RecognizerRegistry, NamesAreSorted) {
  auto registry = fake_registry();
  EXPECT_EQ(registry.names(),
            (std::vector<std::string>{"broken", "local", "null", "offline",
                                      "remote"}));
}

TEST(RecognizerRegistry, RejectsDuplicatesAndEmptyFactories) {
  auto registry = fake_registry();
  EXPECT_THROW(registry.add("local", echo("local", true)),
               std::invalid_argument);
  EXPECT_THROW(registry.add("empty", RecognizerRegistry::Factory{}),
               std::invalid_argument);
  EXPECT_FALSE(registry.contains("empty"));
}

TEST(RecognizerRegistry, CreateFailsSoftly) {
  auto registry = fake_registry();
  Config config;
  EXPECT_EQ(registry.create("missing", config), nullptr);
  EXPECT_EQ(registry.create("offline", config), nullptr);
  EXPECT_EQ(registry.create("broken", config), nullptr);
  EXPECT_EQ(registry.create("null", config), nullptr);

  auto local = registry.create("local", config);
  ASSERT_NE(local, nullptr);
  Utterance utterance;
  utterance.frames = 3;
  EXPECT_EQ(local->recognize(utterance, AudioFormat{}), "local:3");
}

TEST(RecognizerRegistry, SelectFallsBackInPriorityOrder) {
  auto registry = fake_registry();
  Config config;

  auto chosen = registry.select({"", "missing", "offline", "broken", "remote",
                                 "local"},
                                config);
  ASSERT_NE(chosen, nullptr);
  EXPECT_EQ(chosen->name(), "remote");

  EXPECT_EQ(registry.select({"offline", "null"}, config), nullptr);
  EXPECT_EQ(registry.select({}, config), nullptr);
}
