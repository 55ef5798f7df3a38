//
//  quiet.cpp
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

#include <alsa/asoundlib.h>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>

#include "log.hpp"
#include "quiet.hpp"

StderrSilencer::StderrSilencer(bool enabled) {
  if (!enabled)
    return;

  std::fflush(stderr);
  int null_fd = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
  if (null_fd < 0) {
    BOOST_LOG_TRIVIAL(debug) << "quiet:: cannot open /dev/null";
    return;
  }

  saved_fd_ = ::dup(STDERR_FILENO);
  if (saved_fd_ < 0 || ::dup2(null_fd, STDERR_FILENO) < 0) {
    BOOST_LOG_TRIVIAL(debug) << "quiet:: cannot redirect stderr";
    if (saved_fd_ >= 0) {
      ::close(saved_fd_);
      saved_fd_ = -1;
    }
  }
  ::close(null_fd);
}

StderrSilencer::~StderrSilencer() {
  if (saved_fd_ < 0)
    return;
  std::fflush(stderr);
  ::dup2(saved_fd_, STDERR_FILENO);
  ::close(saved_fd_);
  saved_fd_ = -1;
}

static void alsa_silent_handler(const char *, int, const char *, int,
                                const char *, ...) {}

QuietAudioScope::QuietAudioScope(bool enabled)
    : enabled_(enabled), stderr_(enabled) {
  if (enabled_) {
    snd_lib_error_set_handler(alsa_silent_handler);
  }
}

QuietAudioScope::~QuietAudioScope() {
  if (enabled_) {
    /* back to the library default handler */
    snd_lib_error_set_handler(nullptr);
  }
}
