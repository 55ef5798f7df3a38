//
//  test_main.cpp
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

#include "config.hpp"
#include "log.hpp"

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);

  /* per frame trace output drowns the test report, keep warnings and up */
  Config config;
  config.set_log_severity(boost::log::trivial::warning);
  log_init(config);

  return RUN_ALL_TESTS();
}
