//
//  adaptive_threshold.hpp
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

#ifndef _ADAPTIVE_THRESHOLD_HPP_
#define _ADAPTIVE_THRESHOLD_HPP_

#include "config.hpp"

/* Silence energy floor tracking the ambient noise from below.
   Only frames judged silent may be observed. */
class AdaptiveThreshold {
public:
  explicit AdaptiveThreshold(const Config &config)
      : AdaptiveThreshold(config.get_silence_threshold(),
                          config.get_dynamic_silence()){};
  AdaptiveThreshold(double initial, bool dynamic);

  void observe(double rms);
  double current() const { return floor_; }
  bool is_dynamic() const { return dynamic_; }
  void reset();

  static constexpr double smoothing = 0.95;
  static constexpr double ambient_bias = 1.5;

private:
  double initial_;
  double floor_;
  bool dynamic_;
};

#endif
