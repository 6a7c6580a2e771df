//
//  transcription_gateway.cpp
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

#include "transcription_gateway.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

using steady_clock = std::chrono::steady_clock;

RecognitionResult
TranscriptionGateway::transcribe(const std::string &path,
                                 const std::optional<std::string> &hotword) {
  TimeElapsed te("transcription_gateway:: recognition");
  RecognitionOptions options;
  if (hotword && !hotword->empty()) {
    options.hotword = hotword;
  }
  options.enable_spk = recognizer_->has_diarization();
  if (timeout_.count() > 0) {
    options.deadline = steady_clock::now() + timeout_;
  }

  auto expired = [&]() {
    return options.deadline && steady_clock::now() > *options.deadline;
  };

  RecognitionResult result;
  try {
    result = recognizer_->transcribe(path, options);
  } catch (const GatewayError &e) {
    BOOST_LOG_TRIVIAL(error) << "transcription_gateway:: " << path << ": "
                             << e.what();
    if (e.kind() == ErrorKind::recognition_timeout || expired()) {
      throw GatewayError(ErrorKind::recognition_timeout,
                         "Transcription timed out");
    }
    throw GatewayError(ErrorKind::recognition_failure,
                       std::string("An error occurred during transcription: ") +
                           e.what());
  } catch (const std::exception &e) {
    BOOST_LOG_TRIVIAL(error) << "transcription_gateway:: " << path << ": "
                             << e.what();
    if (expired()) {
      throw GatewayError(ErrorKind::recognition_timeout,
                         "Transcription timed out");
    }
    throw GatewayError(ErrorKind::recognition_failure,
                       std::string("An error occurred during transcription: ") +
                           e.what());
  }

  if (expired()) {
    BOOST_LOG_TRIVIAL(warning)
        << "transcription_gateway:: recognizer ignored the deadline on "
        << path;
  }
  if (result.empty()) {
    BOOST_LOG_TRIVIAL(error) << "transcription_gateway:: empty result for "
                             << path;
    throw GatewayError(ErrorKind::recognition_failure,
                       "An error occurred during transcription: empty result");
  }
  return result;
}

RenderedBody TranscriptionGateway::render(const RecognitionResult &result,
                                          ResponseFormat format) const {
  return ::render(result, format, recognizer_->has_diarization());
}
