//
//  transcription_gateway.hpp
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

#ifndef _TRANSCRIPTION_GATEWAY_HPP_
#define _TRANSCRIPTION_GATEWAY_HPP_

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "formatters.hpp"
#include "recognizer.hpp"

class TranscriptionGateway {
public:
  /* a zero timeout disables the deadline */
  TranscriptionGateway(std::shared_ptr<Recognizer> recognizer,
                       std::chrono::seconds timeout)
      : recognizer_(std::move(recognizer)), timeout_(timeout){};
  TranscriptionGateway() = delete;
  TranscriptionGateway(const TranscriptionGateway &) = delete;

  /*
   * Run the recognizer on a local file. Throws GatewayError with
   * recognition_failure or recognition_timeout, never returns an
   * empty result.
   */
  RecognitionResult transcribe(const std::string &path,
                               const std::optional<std::string> &hotword);

  RenderedBody render(const RecognitionResult &result,
                      ResponseFormat format) const;

  std::chrono::seconds get_timeout() const { return timeout_; }

private:
  std::shared_ptr<Recognizer> recognizer_;
  std::chrono::seconds timeout_;
};

#endif
