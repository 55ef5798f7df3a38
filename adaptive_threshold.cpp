//
//  adaptive_threshold.cpp
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

#include <cmath>

#include "adaptive_threshold.hpp"
#include "log.hpp"

AdaptiveThreshold::AdaptiveThreshold(double initial, bool dynamic)
    : initial_(initial < 0 ? 0 : initial), floor_(initial_), dynamic_(dynamic) {
}

void AdaptiveThreshold::observe(double rms) {
  if (!dynamic_)
    return;

  if (!std::isfinite(rms) || rms < 0) {
    BOOST_LOG_TRIVIAL(debug) << "threshold:: ignoring invalid energy " << rms;
    return;
  }

  floor_ = smoothing * floor_ + (1.0 - smoothing) * (ambient_bias * rms);
  BOOST_LOG_TRIVIAL(trace) << "threshold:: floor " << floor_;
}

void AdaptiveThreshold::reset() { floor_ = initial_; }
