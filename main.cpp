//
//  main.cpp
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

#include <boost/program_options.hpp>
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <future>
#include <iostream>
#include <signal.h>
#include <thread>

#include "capture.hpp"
#include "config.hpp"
#include "device_session.hpp"
#include "log.hpp"
#include "recognizer.hpp"
#include "silero_oracle.hpp"
#include "wav_file.hpp"
#include "wav_source.hpp"

namespace po = boost::program_options;
namespace postyle = boost::program_options::command_line_style;
namespace fs = std::filesystem;

static const std::string version("voicegate-1.0.0");
static std::atomic<bool> terminate = false;

void termination_handler(int) {
  // Terminate program
  terminate = true;
}

bool is_terminated() { return terminate.load(); }

static void list_input_devices(const Config &config) {
  auto devices = DeviceSession::list_devices(config);
  if (devices.empty()) {
    std::cout << "No audio input devices found" << std::endl;
    return;
  }

  std::cout << "\nAvailable Audio Input Devices:\n"
            << "-------------------------------\n";
  for (const auto &device : devices) {
    std::cout << "Device " << device.index << ": " << device.name << '\n'
              << "  Channels: " << device.channels << '\n'
              << "  Sample Rate: " << device.sample_rate << " Hz\n\n";
  }
  std::cout << "To use a specific device, run with: --device_index INDEX"
            << std::endl;
}

static std::string utterance_path(const std::string &dir, uint32_t counter) {
  char name[32];
  snprintf(name, sizeof(name), "utterance-%04u.wav", counter);
  return (fs::path(dir) / name).string();
}

int main(int argc, char *argv[]) {
  int rc(EXIT_SUCCESS);
  po::options_description desc("Options");
  desc.add_options()
      ("version,v", "Print version and exit")
      ("config,C", po::value<std::string>(), "Configuration file, command line options take precedence")
      ("list_devices,L", "List audio input devices and exit")
      ("device_name,D", po::value<std::string>()->default_value("default"), "ALSA capture device name")
      ("device_index,i", po::value<int>(), "ALSA capture card index, overrides device_name")
      ("input_file,I", po::value<std::string>(), "Replay a WAV file instead of capturing")
      ("channels,c", po::value<int>()->default_value(1), "Channels to capture")
      ("sample_rate,r", po::value<int>()->default_value(16000), "Capture sample rate")
      ("format,f", po::value<std::string>()->default_value("int16"), "Sample format, int16 or float32")
      ("chunk_size,k", po::value<int>()->default_value(1024), "Samples per frame")
      ("silence_threshold,t", po::value<float>()->default_value(300.0f, "300"), "Initial RMS silence threshold")
      ("dynamic_silence", po::value<bool>()->default_value(true), "Adapt the silence threshold to the ambient noise")
      ("min_speech_duration", po::value<float>()->default_value(0.05f, "0.05"), "Speech seconds needed to start an utterance")
      ("speech_pad_start", po::value<float>()->default_value(0.1f, "0.1"), "Seconds of audio kept before speech")
      ("speech_pad_end", po::value<float>()->default_value(0.2f, "0.2"), "Seconds of silence ending an utterance")
      ("timeout,T", po::value<float>()->default_value(2.0f, "2.0"), "Seconds a capture may last")
      ("duration", po::value<float>(), "Maximum utterance length in seconds")
      ("no_wait", po::value<bool>()->default_value(false), "Record without waiting for speech")
      ("push_mode", po::value<bool>()->default_value(true), "Read the device on a producer thread")
      ("quiet,q", po::value<bool>()->default_value(true), "Suppress ALSA/JACK error messages")
      ("vad_enabled,e", po::value<bool>()->default_value(false), "Use the Silero VAD instead of energy detection")
      ("vad_mode", po::value<int>()->default_value(1), "VAD aggressiveness from 0 to 3")
      ("vad_frame_ms", po::value<int>()->default_value(30), "VAD analysis window in ms, 0 for the whole frame")
      ("vad_model,a", po::value<std::string>()->default_value("models/ggml-silero-v5.1.2.bin"), "Silero VAD model to use")
      ("vad_threshold", po::value<float>()->default_value(-1.0f, "-1"), "VAD speech probability, negative derives it from vad_mode")
      ("engine,E", po::value<std::string>()->default_value("whisper"), "Speech recognition engine")
      ("fallback_engine", po::value<std::string>()->default_value(""), "Engine used when the first one is not available")
      ("language,l", po::value<std::string>()->default_value("en"), "Whisper default language")
      ("model,m", po::value<std::string>()->default_value("models/ggml-base.en.bin"), "Whisper model to use")
      ("openvino_device,o", po::value<std::string>()->default_value("CPU"), "Whisper openvino device to use")
      ("beam_size", po::value<int>()->default_value(5), "Whisper beam size, 1 for greedy decoding")
      ("threads", po::value<int>()->default_value(4), "Whisper threads")
      ("use_context,x", po::value<bool>()->default_value(false), "Whisper enable/disable token context")
      ("continuous", po::value<bool>()->default_value(true), "Keep capturing utterances until interrupted")
      ("save_dir,s", po::value<std::string>(), "Directory receiving each utterance as a WAV file")
      ("log_level,d", po::value<int>()->default_value(2), "Log level from 0=trace to 5=fatal")
      ("help,h", "Print this help " "message");
  int unix_style = postyle::unix_style | postyle::short_allow_next;

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .style(unix_style)
                  .run(),
              vm);

    if (vm.count("config")) {
      po::store(po::parse_config_file<char>(
                    vm["config"].as<std::string>().c_str(), desc),
                vm);
    }

    po::notify(vm);

    if (vm.count("version")) {
      std::cout << version << '\n';
      return EXIT_SUCCESS;
    }
    if (vm.count("help")) {
      std::cout << "USAGE: " << argv[0] << '\n' << desc << '\n';
      return EXIT_SUCCESS;
    }

  } catch (po::error &poe) {
    std::cerr << poe.what() << '\n'
              << "USAGE: " << argv[0] << '\n'
              << desc << '\n';
    return EXIT_FAILURE;
  }

  auto format = parse_sample_format(vm["format"].as<std::string>());
  if (!format) {
    std::cerr << "invalid format " << vm["format"].as<std::string>() << '\n';
    return EXIT_FAILURE;
  }
  if (vm["channels"].as<int>() < 1 || vm["channels"].as<int>() > 255 ||
      vm["sample_rate"].as<int>() <= 0 || vm["chunk_size"].as<int>() <= 0) {
    std::cerr << "invalid channels, sample rate or chunk size\n";
    return EXIT_FAILURE;
  }
  if (vm["vad_mode"].as<int>() < 0 || vm["vad_mode"].as<int>() > 3) {
    std::cerr << "vad_mode must be between 0 and 3\n";
    return EXIT_FAILURE;
  }
  if (vm["vad_frame_ms"].as<int>() < 0) {
    std::cerr << "vad_frame_ms cannot be negative\n";
    return EXIT_FAILURE;
  }

  signal(SIGINT, termination_handler);
  signal(SIGTERM, termination_handler);

  Config config;
  config.set_device_name(vm["device_name"].as<std::string>());
  if (vm.count("device_index")) {
    config.set_device_index(vm["device_index"].as<int>());
  }
  config.set_channels(vm["channels"].as<int>());
  config.set_sample_rate(vm["sample_rate"].as<int>());
  config.set_format(*format);
  config.set_chunk_size(vm["chunk_size"].as<int>());
  config.set_silence_threshold(vm["silence_threshold"].as<float>());
  config.set_dynamic_silence(vm["dynamic_silence"].as<bool>());
  config.set_min_speech_duration(vm["min_speech_duration"].as<float>());
  config.set_speech_pad_start(vm["speech_pad_start"].as<float>());
  config.set_speech_pad_end(vm["speech_pad_end"].as<float>());
  config.set_timeout(vm["timeout"].as<float>());
  config.set_push_mode(vm["push_mode"].as<bool>());
  config.set_quiet(vm["quiet"].as<bool>());
  config.set_vad_enabled(vm["vad_enabled"].as<bool>());
  config.set_vad_mode(vm["vad_mode"].as<int>());
  config.set_vad_frame_ms(vm["vad_frame_ms"].as<int>());
  config.set_vad_model(vm["vad_model"].as<std::string>());
  config.set_vad_threshold(vm["vad_threshold"].as<float>());
  config.set_engine(vm["engine"].as<std::string>());
  config.set_fallback_engine(vm["fallback_engine"].as<std::string>());
  config.set_language(vm["language"].as<std::string>());
  config.set_model(vm["model"].as<std::string>());
  config.set_openvino_device(vm["openvino_device"].as<std::string>());
  config.set_beam_size(vm["beam_size"].as<int>());
  config.set_threads(vm["threads"].as<int>());
  config.set_use_context(vm["use_context"].as<bool>());
  config.set_log_severity(vm["log_level"].as<int>());

  /* init logging */
  log_init(config);

  if (vm.count("list_devices")) {
    list_input_devices(config);
    return EXIT_SUCCESS;
  }

  std::optional<double> duration;
  if (vm.count("duration")) {
    duration = vm["duration"].as<float>();
  }
  bool wait_for_speech = !vm["no_wait"].as<bool>();
  bool continuous = vm["continuous"].as<bool>();
  std::string save_dir = vm.count("save_dir") ? vm["save_dir"].as<std::string>() : "";

  BOOST_LOG_TRIVIAL(debug) << "main:: initializing ...";
  try {
    if (!save_dir.empty()) {
      fs::create_directories(save_dir);
    }

    auto registry = RecognizerRegistry::builtin();
    auto recognizer = registry.select(
        {config.get_engine(), config.get_fallback_engine()}, config);
    if (!recognizer && save_dir.empty()) {
      throw std::runtime_error("main:: no speech recognition engine available");
    }

    std::shared_ptr<SpeechOracle> oracle;
    if (config.get_vad_enabled()) {
      oracle = SileroOracle::create(config);
      if (!oracle) {
        BOOST_LOG_TRIVIAL(warning) << "main:: VAD unavailable, using energy "
                                      "detection";
      }
    }

    std::unique_ptr<AudioSource> source;
    if (vm.count("input_file")) {
      source = std::make_unique<WavFileSource>(vm["input_file"].as<std::string>());
    } else {
      source = std::make_unique<Capture>(config.get_capture_device(),
                                         config.get_quiet());
    }

    DeviceError error;
    auto session = DeviceSession::open(config, std::move(source), oracle, error);
    if (!session) {
      throw std::runtime_error(std::string("main:: cannot start audio: ") +
                               to_string(error));
    }

    BOOST_LOG_TRIVIAL(debug) << "main:: init done, entering loop...";

    std::atomic_bool done{false};
    auto watcher = std::async(std::launch::async, [&]() {
      while (!done && !is_terminated()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
      if (is_terminated()) {
        BOOST_LOG_TRIVIAL(info) << "main:: termination requested";
        session->request_stop();
      }
    });

    uint32_t counter = 0;
    bool stream_lost = false;
    do {
      auto utterance = session->capture(duration, wait_for_speech);
      auto outcome = session->get_last_outcome();

      if (utterance) {
        ++counter;
        if (!save_dir.empty()) {
          auto path = utterance_path(save_dir, counter);
          if (write_wav(path, utterance->pcm, config.get_audio_format())) {
            BOOST_LOG_TRIVIAL(info) << "main:: saved " << path;
          }
        }
        if (recognizer) {
          auto text = recognizer->recognize(*utterance, config.get_audio_format());
          if (text) {
            std::cout << *text << std::endl;
          } else {
            BOOST_LOG_TRIVIAL(info) << "main:: no speech recognised";
          }
        }
      }

      if (outcome == CaptureOutcome::stopped ||
          outcome == CaptureOutcome::empty_capture) {
        break;
      }
      if (outcome == CaptureOutcome::stream_error && !session->is_streaming()) {
        stream_lost = true;
        break;
      }
    } while (continuous && !is_terminated());

    done = true;
    watcher.get();
    session->stop_stream();
    if (stream_lost) {
      throw std::runtime_error("main:: audio stream lost");
    }
  } catch (std::exception &e) {
    BOOST_LOG_TRIVIAL(fatal) << "main:: fatal exception error: " << e.what();
    rc = EXIT_FAILURE;
  }

  BOOST_LOG_TRIVIAL(debug) << "main:: exiting with code: " << rc;
  return rc;
}
