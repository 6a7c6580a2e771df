//
//  whisper.hpp
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

#ifndef _WHISPER_HPP_
#define _WHISPER_HPP_

#include <string>
#include <whisper.h>

#include "config.hpp"
#include "recognizer.hpp"

/*
 * whisper.cpp recognizer. The model context is loaded once by init()
 * and only read afterwards; every transcription runs on its own
 * whisper_state, so concurrent requests do not serialize.
 */
class Whisper : public Recognizer {
public:
  explicit Whisper(const Config &config) : config_(config){};
  Whisper(const Whisper &) = delete;
  ~Whisper() override;

  bool init();
  void terminate();

  RecognitionResult transcribe(const std::string &path,
                               const RecognitionOptions &options) override;

  bool has_diarization() const override { return config_.get_diarize(); }

private:
  const Config &config_;
  struct whisper_context *ctx_{0};
};

#endif
