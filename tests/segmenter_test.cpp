//
//  segmenter_test.cpp
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
#include <memory>

#include "audio_fixtures.hpp"
#include "segmenter.hpp"

namespace {

class SegmenterTest : public ::testing::Test {
protected:
  void SetUp() override { build(test_config()); }

  void build(const Config &config) {
    segmenter_.reset();
    classifier_.reset();
    threshold_ = std::make_unique<AdaptiveThreshold>(config);
    classifier_ = std::make_unique<FrameClassifier>(config.get_audio_format(),
                                                    *threshold_);
    segmenter_ = std::make_unique<Segmenter>(config, *classifier_);
  }

  /* feeds runs of {count, level} frames until the segmenter is done */
  void feed(std::initializer_list<std::pair<int, int16_t>> runs) {
    for (auto &data : frame_runs(runs)) {
      if (segmenter_->is_done())
        return;
      segmenter_->feed(AudioFrame{std::move(data), sequence_++});
    }
  }

  std::unique_ptr<AdaptiveThreshold> threshold_;
  std::unique_ptr<FrameClassifier> classifier_;
  std::unique_ptr<Segmenter> segmenter_;
  uint64_t sequence_{0};
};

} // namespace

TEST_F(SegmenterTest, DerivesFrameCountsFromDurations) {
  /* 64 ms frames: 100 ms lead-in, 50 ms onset */
  EXPECT_EQ(segmenter_->get_pad_frames(), 1u);
  EXPECT_EQ(segmenter_->get_onset_frames(), 1u);
  EXPECT_EQ(segmenter_->get_state(), Segmenter::State::idle);
}

TEST_F(SegmenterTest, UtteranceWithLeadInAndTrailingSilence) {
  segmenter_->begin(true);
  feed({{5, quiet_level}, {10, speech_level}, {8, quiet_level}});

  ASSERT_EQ(segmenter_->get_state(), Segmenter::State::completed);
  auto utterance = segmenter_->take_utterance();
  ASSERT_TRUE(utterance.has_value());
  /* one frame of lead-in, ten of speech, four of silence (256 ms > 200 ms) */
  EXPECT_EQ(utterance->first_sequence, 4u);
  EXPECT_EQ(utterance->frames, 15u);
  EXPECT_EQ(utterance->pcm.size(), 15u * 1024 * 2);
  EXPECT_EQ(sequence_, 19u);
}

TEST_F(SegmenterTest, SilenceOnlyKeepsWaitingWithBoundedLeadIn) {
  segmenter_->begin(true);
  feed({{40, quiet_level}});

  EXPECT_EQ(segmenter_->get_state(), Segmenter::State::waiting_for_speech);
  EXPECT_FALSE(segmenter_->has_speech_started());
  EXPECT_LE(segmenter_->get_pending_frames(), segmenter_->get_pad_frames());
  EXPECT_EQ(segmenter_->get_frames_since_start(), 40u);
  EXPECT_EQ(segmenter_->get_accumulated_frames(), 0u);
}

TEST_F(SegmenterTest, ShortPauseDoesNotEndUtterance) {
  segmenter_->begin(true);
  feed({{3, speech_level}, {3, quiet_level}, {3, speech_level}});

  EXPECT_EQ(segmenter_->get_state(), Segmenter::State::capturing);
  EXPECT_EQ(segmenter_->get_consecutive_silence_frames(), 0u);
  EXPECT_EQ(segmenter_->get_accumulated_frames(), 9u);
}

TEST_F(SegmenterTest, NoLeadInWhenPadStartIsZero) {
  auto config = test_config();
  config.set_speech_pad_start(0);
  build(config);
  segmenter_->begin(true);
  feed({{5, quiet_level}, {2, speech_level}, {8, quiet_level}});

  auto utterance = segmenter_->take_utterance();
  ASSERT_TRUE(utterance.has_value());
  EXPECT_EQ(utterance->first_sequence, 5u);
  EXPECT_EQ(utterance->frames, 6u);
}

TEST_F(SegmenterTest, LongerLeadInKeepsMostRecentFrames) {
  auto config = test_config();
  config.set_speech_pad_start(0.2f);
  build(config);
  ASSERT_EQ(segmenter_->get_pad_frames(), 3u);

  segmenter_->begin(true);
  feed({{10, quiet_level}, {1, speech_level}, {4, quiet_level}});
  auto utterance = segmenter_->take_utterance();
  ASSERT_TRUE(utterance.has_value());
  EXPECT_EQ(utterance->first_sequence, 7u);
  EXPECT_EQ(utterance->frames, 8u);
}

TEST_F(SegmenterTest, ShortBurstBelowMinimumSpeechIsIgnored) {
  auto config = test_config();
  config.set_min_speech_duration(0.15f);
  build(config);
  ASSERT_EQ(segmenter_->get_onset_frames(), 3u);

  segmenter_->begin(true);
  feed({{4, quiet_level}, {2, speech_level}, {4, quiet_level}});
  EXPECT_EQ(segmenter_->get_state(), Segmenter::State::waiting_for_speech);
  EXPECT_FALSE(segmenter_->has_speech_started());
  EXPECT_LE(segmenter_->get_pending_frames(), segmenter_->get_pad_frames());

  feed({{3, speech_level}});
  EXPECT_EQ(segmenter_->get_state(), Segmenter::State::capturing);
  EXPECT_EQ(segmenter_->get_accumulated_frames(), 4u);
}

TEST_F(SegmenterTest, FrameLimitWinsOverEndpointing) {
  segmenter_->begin(true, 6);
  feed({{2, quiet_level}, {20, speech_level}});

  ASSERT_EQ(segmenter_->get_state(), Segmenter::State::completed);
  auto utterance = segmenter_->take_utterance();
  ASSERT_TRUE(utterance.has_value());
  EXPECT_EQ(utterance->frames, 6u);
  EXPECT_EQ(utterance->first_sequence, 1u);
}

TEST_F(SegmenterTest, WithoutWaitingRecordsFixedLength) {
  segmenter_->begin(false, 7);
  EXPECT_EQ(segmenter_->get_state(), Segmenter::State::capturing);
  feed({{1, speech_level}, {20, quiet_level}});

  ASSERT_EQ(segmenter_->get_state(), Segmenter::State::completed);
  auto utterance = segmenter_->take_utterance();
  ASSERT_TRUE(utterance.has_value());
  EXPECT_EQ(utterance->first_sequence, 0u);
  EXPECT_EQ(utterance->frames, 7u);
}

TEST_F(SegmenterTest, WithoutWaitingAndNoLimitEndsOnSilence) {
  segmenter_->begin(false);
  EXPECT_TRUE(segmenter_->has_speech_started());
  feed({{2, speech_level}, {30, quiet_level}});

  ASSERT_EQ(segmenter_->get_state(), Segmenter::State::completed);
  auto utterance = segmenter_->take_utterance();
  ASSERT_TRUE(utterance.has_value());
  EXPECT_EQ(utterance->first_sequence, 0u);
  /* two speech frames and four silent ones (256 ms > 200 ms) */
  EXPECT_EQ(utterance->frames, 6u);
}

TEST_F(SegmenterTest, WithoutWaitingSilenceFromTheStartEnds) {
  segmenter_->begin(false);
  feed({{30, quiet_level}});

  ASSERT_EQ(segmenter_->get_state(), Segmenter::State::completed);
  auto utterance = segmenter_->take_utterance();
  ASSERT_TRUE(utterance.has_value());
  EXPECT_EQ(utterance->frames, 4u);
}

TEST_F(SegmenterTest, ExpiryBeforeSpeechYieldsNothing) {
  segmenter_->begin(true);
  feed({{6, quiet_level}});
  EXPECT_EQ(segmenter_->expire(), Segmenter::State::timed_out);
  EXPECT_FALSE(segmenter_->take_utterance().has_value());
}

TEST_F(SegmenterTest, ExpiryDuringSpeechKeepsPartialCapture) {
  segmenter_->begin(true);
  feed({{3, quiet_level}, {5, speech_level}});
  EXPECT_EQ(segmenter_->expire(), Segmenter::State::timed_out);

  auto utterance = segmenter_->take_utterance();
  ASSERT_TRUE(utterance.has_value());
  EXPECT_EQ(utterance->first_sequence, 2u);
  EXPECT_EQ(utterance->frames, 6u);
}

TEST_F(SegmenterTest, FinishedSegmenterIgnoresFrames) {
  segmenter_->begin(true);
  feed({{3, speech_level}});
  segmenter_->fail();
  ASSERT_EQ(segmenter_->get_state(), Segmenter::State::error);

  segmenter_->feed(AudioFrame{pcm16_frame(1024, speech_level), 99});
  EXPECT_EQ(segmenter_->get_accumulated_frames(), 3u);
  /* a later expiry does not rewrite the outcome */
  EXPECT_EQ(segmenter_->expire(), Segmenter::State::error);
}

TEST_F(SegmenterTest, BeginResetsPreviousCapture) {
  segmenter_->begin(true);
  feed({{3, speech_level}, {1, quiet_level}});
  segmenter_->begin(true);

  EXPECT_EQ(segmenter_->get_accumulated_frames(), 0u);
  EXPECT_EQ(segmenter_->get_pending_frames(), 0u);
  EXPECT_FALSE(segmenter_->has_speech_started());
  EXPECT_FALSE(segmenter_->take_utterance().has_value());
}
