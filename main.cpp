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

#include <boost/algorithm/string.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <iostream>

#include "api.hpp"
#include "chunk_assembler.hpp"
#include "chunk_store.hpp"
#include "config.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "remote_fetcher.hpp"
#include "transcription_gateway.hpp"
#include "whisper.hpp"

namespace net = boost::asio;
namespace po = boost::program_options;
namespace postyle = boost::program_options::command_line_style;
namespace fs = std::filesystem;

static const std::string version("whisper-gateway-1.0.0");
static const std::string env_prefix("WHISPER_GATEWAY_");

static void schedule_sweep(net::steady_timer &timer, ChunkAssembler &assembler,
                           const Config &config) {
  timer.expires_after(std::chrono::seconds(config.get_sweep_interval()));
  timer.async_wait([&timer, &assembler, &config](boost::system::error_code ec) {
    if (ec)
      return;
    try {
      assembler.sweep_expired(std::chrono::seconds(config.get_session_ttl()));
    } catch (const std::exception &e) {
      BOOST_LOG_TRIVIAL(error) << "main:: session sweep failed: " << e.what();
    }
    schedule_sweep(timer, assembler, config);
  });
}

int main(int argc, char *argv[]) {
  int rc(EXIT_SUCCESS);
  Config defaults;
  po::options_description desc("Options");
  desc.add_options()
      ("version,v", "Print version and exit")
      ("config,C", po::value<std::string>(), "INI configuration file")
      ("host,H", po::value<std::string>()->default_value(defaults.get_host()), "Listen address")
      ("port,p", po::value<int>()->default_value(defaults.get_port()), "Listen port")
      ("threads,t", po::value<int>()->default_value(defaults.get_threads()), "HTTP worker threads")
      ("api_key,k", po::value<std::string>()->default_value(defaults.get_api_key()), "Bearer token clients must present")
      ("staging_dir,s", po::value<std::string>()->default_value(defaults.get_staging_dir()), "Directory for chunks and temporary files")
      ("max_body_size", po::value<uint64_t>()->default_value(defaults.get_max_body_size()), "Maximum request body size in bytes")
      ("read_timeout", po::value<uint32_t>()->default_value(defaults.get_read_timeout()), "Seconds a client may stay silent while sending a request")
      ("model,m", po::value<std::string>()->default_value(defaults.get_model()), "Whisper model to use")
      ("language,l", po::value<std::string>()->default_value(defaults.get_language()), "Whisper language, auto to detect")
      ("use_gpu", po::value<bool>()->default_value(defaults.get_use_gpu()), "Whisper enable/disable GPU")
      ("recognition_threads", po::value<int>()->default_value(defaults.get_recognition_threads()), "Whisper threads per transcription")
      ("vad_enabled,e", po::value<bool>()->default_value(defaults.get_vad_enabled()), "Whisper enable/disable VAD")
      ("vad_model,a", po::value<std::string>()->default_value(defaults.get_vad_model()), "Whisper VAD model to use")
      ("vad_threshold", po::value<float>()->default_value(defaults.get_vad_threshold(), "0.5"), "Whisper VAD threshold to use")
      ("diarize", po::value<bool>()->default_value(defaults.get_diarize()), "Whisper tinydiarize speaker turns, needs a tdrz model")
      ("convert", po::value<bool>()->default_value(defaults.get_convert()), "Convert non WAV input with ffmpeg")
      ("recognition_timeout", po::value<uint32_t>()->default_value(defaults.get_recognition_timeout()), "Transcription timeout in seconds, 0 disables")
      ("fetch_timeout", po::value<uint32_t>()->default_value(defaults.get_fetch_timeout()), "Remote download timeout in seconds, 0 disables")
      ("session_ttl", po::value<uint32_t>()->default_value(defaults.get_session_ttl()), "Idle seconds before an upload session is removed, 0 disables")
      ("sweep_interval", po::value<uint32_t>()->default_value(defaults.get_sweep_interval()), "Seconds between expired session sweeps")
      ("log_level,d", po::value<int>()->default_value(defaults.get_log_severity()), "Log level from 0=trace to 5=fatal")
      ("syslog", po::value<bool>()->default_value(defaults.get_syslog()), "Log to syslog instead of the console")
      ("help,h", "Print this help message");
  int unix_style = postyle::unix_style | postyle::short_allow_next;

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .style(unix_style)
                  .run(),
              vm);

    /* WHISPER_GATEWAY_API_KEY -> api_key */
    po::store(po::parse_environment(
                  desc,
                  [&desc](const std::string &name) -> std::string {
                    if (name.compare(0, env_prefix.size(), env_prefix) != 0)
                      return "";
                    auto option = boost::algorithm::to_lower_copy(
                        name.substr(env_prefix.size()));
                    if (option == "config" ||
                        desc.find_nothrow(option, false) != nullptr)
                      return option;
                    return "";
                  }),
              vm);

    if (vm.count("config")) {
      po::store(po::parse_config_file<char>(
                    vm["config"].as<std::string>().c_str(), desc, true),
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

  Config config;
  config.set_host(vm["host"].as<std::string>());
  config.set_port(vm["port"].as<int>());
  config.set_threads(std::max(1, vm["threads"].as<int>()));
  config.set_api_key(vm["api_key"].as<std::string>());
  config.set_staging_dir(vm["staging_dir"].as<std::string>());
  config.set_max_body_size(vm["max_body_size"].as<uint64_t>());
  config.set_read_timeout(std::max(1u, vm["read_timeout"].as<uint32_t>()));
  config.set_model(vm["model"].as<std::string>());
  config.set_language(vm["language"].as<std::string>());
  config.set_use_gpu(vm["use_gpu"].as<bool>());
  config.set_recognition_threads(vm["recognition_threads"].as<int>());
  config.set_vad_enabled(vm["vad_enabled"].as<bool>());
  config.set_vad_model(vm["vad_model"].as<std::string>());
  config.set_vad_threshold(vm["vad_threshold"].as<float>());
  config.set_diarize(vm["diarize"].as<bool>());
  config.set_convert(vm["convert"].as<bool>());
  config.set_recognition_timeout(vm["recognition_timeout"].as<uint32_t>());
  config.set_fetch_timeout(vm["fetch_timeout"].as<uint32_t>());
  config.set_session_ttl(vm["session_ttl"].as<uint32_t>());
  config.set_sweep_interval(std::max(1u, vm["sweep_interval"].as<uint32_t>()));
  config.set_log_severity(vm["log_level"].as<int>());
  config.set_syslog(vm["syslog"].as<bool>());

  /* init logging */
  log_init(config);

  if (vm["port"].as<int>() <= 0 || vm["port"].as<int>() > 65535) {
    BOOST_LOG_TRIVIAL(fatal) << "main:: port out of range";
    return EXIT_FAILURE;
  }
  if (config.get_api_key() == defaults.get_api_key()) {
    BOOST_LOG_TRIVIAL(warning) << "main:: running with the default API key";
  }

  BOOST_LOG_TRIVIAL(debug) << "main:: initializing ...";
  try {
    fs::path staging(config.get_staging_dir());

    /* loaded once here and shared read-only by every request */
    auto whisper = std::make_shared<Whisper>(config);
    if (!whisper->init()) {
      throw std::runtime_error(std::string("main:: Whisper init failed"));
    }

    ChunkStore store(staging / "chunks");
    ChunkAssembler assembler(store);
    RemoteFetcher fetcher(staging / "tmp",
                          std::chrono::seconds(config.get_fetch_timeout()));
    TranscriptionGateway gateway(
        whisper, std::chrono::seconds(config.get_recognition_timeout()));
    Api api(config, assembler, fetcher, gateway, staging / "tmp");

    /* signals and the sweep timer, requests run on the server pool */
    net::io_context ioc;

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](const boost::system::error_code &, int signum) {
      BOOST_LOG_TRIVIAL(info) << "main:: got signal " << signum;
      ioc.stop();
    });

    HttpServer server(config, api);
    if (!server.start()) {
      throw std::runtime_error(std::string("main:: HTTP server start failed"));
    }

    net::steady_timer sweep_timer(ioc);
    if (config.get_session_ttl() > 0) {
      schedule_sweep(sweep_timer, assembler, config);
    }

    BOOST_LOG_TRIVIAL(debug) << "main:: init done, entering loop...";
    ioc.run();

    server.stop();
    whisper->terminate();
  } catch (std::exception &e) {
    BOOST_LOG_TRIVIAL(fatal) << "main:: fatal exception error: " << e.what();
    rc = EXIT_FAILURE;
  }

  BOOST_LOG_TRIVIAL(info) << "main:: exiting with code: " << rc;
  return rc;
}
