//
//  utils.hpp
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

#ifndef _UTILS_HPP_
#define _UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <string>

#include "log.hpp"

/* logs at debug level how long the enclosing scope took */
class TimeElapsed {
public:
  TimeElapsed() = delete;
  explicit TimeElapsed(const std::string &desc)
      : desc_(desc), start_(std::chrono::steady_clock::now()) {}

  uint32_t elapsed() const {
    std::chrono::duration<double, std::milli> elapsed =
        std::chrono::steady_clock::now() - start_;
    return static_cast<uint32_t>(elapsed.count());
  }

  ~TimeElapsed() {
    BOOST_LOG_TRIVIAL(debug) << desc_ << " returned in " << elapsed() << " ms";
  }

private:
  std::string desc_;
  std::chrono::steady_clock::time_point start_;
};

#endif
