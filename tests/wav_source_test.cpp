//
//  wav_source_test.cpp
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

#include <cstdio>
#include <gtest/gtest.h>
#include <thread>

#include "audio_fixtures.hpp"
#include "device_session.hpp"
#include "wav_file.hpp"
#include "wav_source.hpp"

using namespace std::chrono_literals;

namespace {

class WavFileSourceTest : public ::testing::Test {
protected:
  void SetUp() override {
    path_ = ::testing::TempDir() + "voicegate_wav_source_test.wav";
  }
  void TearDown() override { std::remove(path_.c_str()); }

  void write(const std::vector<uint8_t> &pcm,
             const AudioFormat &format = AudioFormat{}) {
    ASSERT_TRUE(write_wav(path_, pcm, format));
  }

  std::string path_;
};

} // namespace

TEST_F(WavFileSourceTest, YieldsChunksThenEndOfStream) {
  write(pcm16_frame(10, quiet_level));
  WavFileSource source(path_);
  ASSERT_EQ(source.open(AudioFormat{}, 4), DeviceError::none);
  ASSERT_TRUE(source.start());

  std::vector<uint8_t> frame;
  ASSERT_EQ(source.read(frame, 10ms), ReadStatus::ok);
  EXPECT_EQ(frame.size(), 8u);
  ASSERT_EQ(source.read(frame, 10ms), ReadStatus::ok);
  EXPECT_EQ(frame.size(), 8u);
  ASSERT_EQ(source.read(frame, 10ms), ReadStatus::ok);
  EXPECT_EQ(frame.size(), 4u);
  EXPECT_EQ(source.read(frame, 10ms), ReadStatus::end_of_stream);

  source.close();
  source.close();
  EXPECT_FALSE(source.is_open());
  EXPECT_EQ(source.read(frame, 10ms), ReadStatus::error);
}

TEST_F(WavFileSourceTest, MissingFileIsUnavailable) {
  WavFileSource source(path_ + ".missing");
  EXPECT_EQ(source.open(AudioFormat{}, 1024), DeviceError::device_unavailable);
  EXPECT_FALSE(source.is_open());
}

TEST_F(WavFileSourceTest, FormatMismatchFailsOpen) {
  write(pcm16_frame(32, quiet_level), AudioFormat{44100, 1, SampleFormat::int16});
  WavFileSource source(path_);
  EXPECT_EQ(source.open(AudioFormat{}, 1024), DeviceError::device_open_failed);
  EXPECT_FALSE(source.is_open());
}

TEST_F(WavFileSourceTest, RecordingIsNotLive) {
  EXPECT_FALSE(WavFileSource(path_).is_live());
  EXPECT_TRUE(WavFileSource(path_, true).is_live());
}

TEST_F(WavFileSourceTest, OpenedSessionReplaysEveryUtterance) {
  std::vector<uint8_t> pcm;
  for (auto &frame : frame_runs({{5, quiet_level},
                                 {10, speech_level},
                                 {8, quiet_level},
                                 {6, speech_level},
                                 {8, quiet_level}})) {
    pcm.insert(pcm.end(), frame.begin(), frame.end());
  }
  write(pcm);

  for (bool push : {true, false}) {
    SCOPED_TRACE(push ? "push" : "pull");
    auto config = test_config();
    config.set_push_mode(push);
    DeviceError error;
    auto session = DeviceSession::open(
        config, std::make_unique<WavFileSource>(path_), nullptr, error);
    ASSERT_NE(session, nullptr);
    /* give the producer time to read the whole file ahead of us */
    std::this_thread::sleep_for(20ms);

    auto first = session->capture();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->first_sequence, 4u);
    EXPECT_EQ(first->frames, 15u);

    auto second = session->capture();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->first_sequence, 22u);
    EXPECT_EQ(second->frames, 11u);

    EXPECT_FALSE(session->capture().has_value());
    EXPECT_EQ(session->get_last_outcome(), CaptureOutcome::empty_capture);
  }
}

TEST_F(WavFileSourceTest, ReplayedRecordingIsSegmented) {
  std::vector<uint8_t> pcm;
  for (auto &frame :
       frame_runs({{5, quiet_level}, {10, speech_level}, {8, quiet_level}})) {
    pcm.insert(pcm.end(), frame.begin(), frame.end());
  }
  write(pcm);

  auto config = test_config();
  config.set_push_mode(false);
  DeviceSession session(config, std::make_unique<WavFileSource>(path_));
  auto utterance = session.capture();

  ASSERT_TRUE(utterance.has_value());
  EXPECT_EQ(utterance->first_sequence, 4u);
  EXPECT_EQ(utterance->frames, 15u);
}
