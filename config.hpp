//
//  config.hpp
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

#ifndef _CONFIG_HPP_
#define _CONFIG_HPP_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

class Config {
 public:
  const std::string& get_host() const { return host_; }
  uint16_t get_port() const { return port_; }
  int get_threads() const { return threads_; }
  const std::string& get_api_key() const { return api_key_; }
  const std::string& get_staging_dir() const { return staging_dir_; }
  uint64_t get_max_body_size() const { return max_body_size_; }
  uint32_t get_read_timeout() const { return read_timeout_; }
  const std::string& get_model() const { return model_; }
  const std::string& get_language() const { return language_; }
  bool get_use_gpu() const { return use_gpu_; }
  int get_recognition_threads() const { return recognition_threads_; }
  bool get_vad_enabled() const { return vad_enabled_; };
  const std::string& get_vad_model() const { return vad_model_; };
  float get_vad_threshold() const { return vad_threshold_; };
  bool get_diarize() const { return diarize_; };
  bool get_convert() const { return convert_; };
  uint32_t get_recognition_timeout() const { return recognition_timeout_; }
  uint32_t get_fetch_timeout() const { return fetch_timeout_; }
  uint32_t get_session_ttl() const { return session_ttl_; }
  uint32_t get_sweep_interval() const { return sweep_interval_; }
  int get_log_severity() const { return log_severity_; };
  bool get_syslog() const { return syslog_; };

  void set_host(const std::string& host) { host_ = host; }
  void set_port(uint16_t port) { port_ = port; }
  void set_threads(int threads) { threads_ = threads; }
  void set_api_key(const std::string& api_key) { api_key_ = api_key; }
  void set_staging_dir(const std::string& staging_dir) {
    staging_dir_ = staging_dir;
  }
  void set_max_body_size(uint64_t max_body_size) {
    max_body_size_ = max_body_size;
  }
  void set_read_timeout(uint32_t read_timeout) { read_timeout_ = read_timeout; }
  void set_model(const std::string& model) { model_ = model; }
  void set_language(const std::string& language) { language_ = language; }
  void set_use_gpu(bool use_gpu) { use_gpu_ = use_gpu; }
  void set_recognition_threads(int recognition_threads) {
    recognition_threads_ = recognition_threads;
  }
  void set_vad_enabled(bool vad_enabled) { vad_enabled_ = vad_enabled; };
  void set_vad_model(const std::string& vad_model) { vad_model_ = vad_model; };
  void set_vad_threshold(float vad_threshold) {
    vad_threshold_ = vad_threshold;
  };
  void set_diarize(bool diarize) { diarize_ = diarize; };
  void set_convert(bool convert) { convert_ = convert; };
  void set_recognition_timeout(uint32_t recognition_timeout) {
    recognition_timeout_ = recognition_timeout;
  }
  void set_fetch_timeout(uint32_t fetch_timeout) {
    fetch_timeout_ = fetch_timeout;
  }
  void set_session_ttl(uint32_t session_ttl) { session_ttl_ = session_ttl; }
  void set_sweep_interval(uint32_t sweep_interval) {
    sweep_interval_ = sweep_interval;
  }
  void set_log_severity(int log_severity) { log_severity_ = log_severity; };
  void set_syslog(bool syslog) { syslog_ = syslog; };

 private:
  std::string host_{"0.0.0.0"};
  uint16_t port_{8000};
  int threads_{4};
  std::string api_key_{"your-secret-api-key"};
  std::string staging_dir_{
      (std::filesystem::temp_directory_path() / "whisper-gateway").string()};
  uint64_t max_body_size_{512 * 1024 * 1024};
  uint32_t read_timeout_{60};
  std::string model_{"./models/ggml-base.bin"};
  std::string language_{"auto"};
  bool use_gpu_{true};
  int recognition_threads_{4};
  bool vad_enabled_{true};
  std::string vad_model_{"./models/ggml-silero-v5.1.2.bin"};
  float vad_threshold_{0.5};
  bool diarize_{false};
  bool convert_{true};
  uint32_t recognition_timeout_{600};
  uint32_t fetch_timeout_{300};
  uint32_t session_ttl_{86400};
  uint32_t sweep_interval_{600};
  int log_severity_{2};
  bool syslog_{false};
};

#endif
