//
//  audio_source.cpp
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

#include "audio_source.hpp"

const char *to_string(DeviceError error) {
  switch (error) {
  case DeviceError::none:
    return "none";
  case DeviceError::device_unavailable:
    return "device unavailable";
  case DeviceError::device_open_failed:
    return "device open failed";
  case DeviceError::stream_read_error:
    return "stream read error";
  }
  return "unknown";
}
