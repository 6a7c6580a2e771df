//
//  formatters.cpp
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

#include <cstdio>
#include <sstream>

#include "formatters.hpp"

using json = nlohmann::json;

std::optional<ResponseFormat> parse_response_format(const std::string &name) {
  if (name == "json")
    return ResponseFormat::json;
  if (name == "verbose_json")
    return ResponseFormat::verbose_json;
  if (name == "text")
    return ResponseFormat::text;
  if (name == "srt")
    return ResponseFormat::srt;
  if (name == "vtt")
    return ResponseFormat::vtt;
  return std::nullopt;
}

const char *to_string(ResponseFormat format) {
  switch (format) {
  case ResponseFormat::json:
    return "json";
  case ResponseFormat::verbose_json:
    return "verbose_json";
  case ResponseFormat::text:
    return "text";
  case ResponseFormat::srt:
    return "srt";
  case ResponseFormat::vtt:
    return "vtt";
  }
  return "json";
}

std::string to_timestamp(int64_t ms, bool comma) {
  if (ms < 0)
    ms = 0;
  int64_t hr = ms / (1000 * 60 * 60);
  ms -= hr * (1000 * 60 * 60);
  int64_t min = ms / (1000 * 60);
  ms -= min * (1000 * 60);
  int64_t sec = ms / 1000;
  ms -= sec * 1000;

  char buf[32];
  snprintf(buf, sizeof(buf), "%02d:%02d:%02d%s%03d", static_cast<int>(hr),
           static_cast<int>(min), static_cast<int>(sec), comma ? "," : ".",
           static_cast<int>(ms));
  return std::string(buf);
}

json to_simple_json(const RecognitionResult &result) {
  return json{{"text", result.text}};
}

json to_verbose_json(const RecognitionResult &result, bool speaker_turns) {
  json segments = json::array();
  for (const auto &segment : result.segments) {
    json j{{"id", segments.size()},
           {"start", segment.start_ms / 1000.0},
           {"end", segment.end_ms / 1000.0},
           {"text", boost::algorithm::trim_copy(segment.text)}};
    if (speaker_turns) {
      j["speaker_turn"] = segment.speaker_turn;
    }
    segments.push_back(std::move(j));
  }
  return json{{"text", result.text},
              {"segments", std::move(segments)},
              {"language", result.language}};
}

std::string to_text(const RecognitionResult &result) { return result.text; }

std::string to_srt(const RecognitionResult &result) {
  std::ostringstream ss;
  for (size_t i = 0; i < result.segments.size(); ++i) {
    const auto &segment = result.segments[i];
    if (i > 0)
      ss << "\n";
    ss << i + 1 << "\n";
    ss << to_timestamp(segment.start_ms, true) << " --> "
       << to_timestamp(segment.end_ms, true) << "\n";
    ss << boost::algorithm::trim_copy(segment.text) << "\n";
  }
  return ss.str();
}

std::string to_vtt(const RecognitionResult &result) {
  std::ostringstream ss;
  ss << "WEBVTT\n";
  for (const auto &segment : result.segments) {
    ss << "\n";
    ss << to_timestamp(segment.start_ms, false) << " --> "
       << to_timestamp(segment.end_ms, false) << "\n";
    ss << boost::algorithm::trim_copy(segment.text) << "\n";
  }
  return ss.str();
}

RenderedBody render(const RecognitionResult &result, ResponseFormat format,
                    bool speaker_turns) {
  switch (format) {
  case ResponseFormat::verbose_json:
    return {to_verbose_json(result, speaker_turns)
                .dump(-1, ' ', false, json::error_handler_t::replace),
            "application/json"};
  case ResponseFormat::text:
    return {to_text(result), "text/plain; charset=utf-8"};
  case ResponseFormat::srt:
    return {to_srt(result), "text/plain; charset=utf-8"};
  case ResponseFormat::vtt:
    return {to_vtt(result), "text/plain; charset=utf-8"};
  case ResponseFormat::json:
    break;
  }
  return {to_simple_json(result).dump(-1, ' ', false,
                                     json::error_handler_t::replace),
          "application/json"};
}
