//
//  recognizer.hpp
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

#ifndef _RECOGNIZER_HPP_
#define _RECOGNIZER_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct SentenceSegment {
  int64_t start_ms{0};
  int64_t end_ms{0};
  std::string text;
  /* next segment is spoken by someone else, diarization only */
  bool speaker_turn{false};
};

struct RecognitionResult {
  std::string text;
  std::string language;
  std::vector<SentenceSegment> segments;

  bool empty() const { return text.empty() && segments.empty(); }
};

struct RecognitionOptions {
  std::optional<std::string> hotword;
  bool enable_vad{true};
  bool enable_spk{false};
  /* the recognizer gives up once this point is passed */
  std::optional<std::chrono::steady_clock::time_point> deadline;
};

/*
 * Speech recognition pipeline. Constructed once at startup and shared
 * by all requests, so implementations must accept concurrent calls to
 * transcribe(). Failures are reported by throwing.
 */
class Recognizer {
public:
  virtual ~Recognizer() = default;

  virtual RecognitionResult transcribe(const std::string &path,
                                       const RecognitionOptions &options) = 0;

  virtual bool has_diarization() const { return false; }
};

#endif
