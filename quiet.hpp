//
//  quiet.hpp
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

#ifndef _QUIET_HPP_
#define _QUIET_HPP_

/* Redirects fd 2 to /dev/null while alive. The redirect is process wide and
   hides the log sink too, so keep the scope around the noisy call only. */
class StderrSilencer {
public:
  explicit StderrSilencer(bool enabled = true);
  StderrSilencer(const StderrSilencer &) = delete;
  StderrSilencer &operator=(const StderrSilencer &) = delete;
  ~StderrSilencer();

  bool active() const { return saved_fd_ >= 0; }

private:
  int saved_fd_{-1};
};

/* Silences the ALSA library error handler and the JACK/ALSA chatter that
   goes straight to stderr during device acquisition */
class QuietAudioScope {
public:
  explicit QuietAudioScope(bool enabled = true);
  QuietAudioScope(const QuietAudioScope &) = delete;
  QuietAudioScope &operator=(const QuietAudioScope &) = delete;
  ~QuietAudioScope();

private:
  bool enabled_;
  StderrSilencer stderr_;
};

#endif
