//
//  formatters.hpp
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

#ifndef _FORMATTERS_HPP_
#define _FORMATTERS_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "recognizer.hpp"

enum class ResponseFormat { json, verbose_json, text, srt, vtt };

std::optional<ResponseFormat> parse_response_format(const std::string &name);
const char *to_string(ResponseFormat format);

/* HH:MM:SS,mmm or HH:MM:SS.mmm when comma is false */
std::string to_timestamp(int64_t ms, bool comma = true);

nlohmann::json to_simple_json(const RecognitionResult &result);
nlohmann::json to_verbose_json(const RecognitionResult &result,
                               bool speaker_turns = false);
std::string to_text(const RecognitionResult &result);
std::string to_srt(const RecognitionResult &result);
std::string to_vtt(const RecognitionResult &result);

struct RenderedBody {
  std::string body;
  std::string content_type;
};

RenderedBody render(const RecognitionResult &result, ResponseFormat format,
                    bool speaker_turns = false);

#endif
