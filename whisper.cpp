//
//  whisper.cpp
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

#include <memory>
#include <stdexcept>

#include "audio_file.hpp"
#include "errors.hpp"
#include "fs_utils.hpp"
#include "log.hpp"
#include "utils.hpp"
#include "whisper.hpp"

using steady_clock = std::chrono::steady_clock;

static bool abort_on_deadline(void *user_data) {
  auto deadline = static_cast<const steady_clock::time_point *>(user_data);
  return steady_clock::now() > *deadline;
}

Whisper::~Whisper() { terminate(); }

bool Whisper::init() {
  BOOST_LOG_TRIVIAL(info) << "whisper:: loading model " << config_.get_model();
  TimeElapsed te("whisper:: model load");

  auto cparams = whisper_context_default_params();
  cparams.use_gpu = config_.get_use_gpu();
  ctx_ = whisper_init_from_file_with_params(config_.get_model().c_str(),
                                            cparams);
  if (ctx_ == nullptr) {
    BOOST_LOG_TRIVIAL(fatal) << "whisper:: cannot load model "
                             << config_.get_model();
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "whisper:: model multilingual "
                          << whisper_is_multilingual(ctx_) << ", VAD "
                          << (config_.get_vad_enabled() ? "on" : "off")
                          << ", diarization "
                          << (config_.get_diarize() ? "on" : "off");
  return true;
}

void Whisper::terminate() {
  if (ctx_ != nullptr) {
    BOOST_LOG_TRIVIAL(info) << "whisper:: releasing model";
    whisper_free(ctx_);
    ctx_ = nullptr;
  }
}

RecognitionResult Whisper::transcribe(const std::string &path,
                                      const RecognitionOptions &options) {
  if (ctx_ == nullptr) {
    throw std::runtime_error("whisper model not loaded");
  }
  TimeElapsed te("whisper:: transcription of " + path);

  /* whisper wants 16 kHz mono, anything else goes through ffmpeg */
  TempFile converted;
  auto convert = [&]() {
    if (!config_.get_convert()) {
      throw std::runtime_error(path + " is not 16 kHz WAVE and conversion "
                                      "is disabled");
    }
    converted = TempFile(path + ".16k-" + unique_token() + ".wav");
    convert_to_wav(path, converted.path().string());
    return read_wav(converted.path().string());
  };

  PcmAudio audio = is_wav(path) ? read_wav(path) : convert();
  if (audio.sample_rate != WHISPER_SAMPLE_RATE && converted.empty()) {
    audio = convert();
  }
  if (audio.sample_rate != WHISPER_SAMPLE_RATE) {
    throw std::runtime_error("unexpected sample rate " +
                             std::to_string(audio.sample_rate));
  }

  auto params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
  params.n_threads = config_.get_recognition_threads();
  params.print_progress = false;
  params.print_realtime = false;
  params.print_special = false;
  params.print_timestamps = false;
  params.no_context = true;
  params.language = config_.get_language().c_str();
  params.initial_prompt =
      options.hotword ? options.hotword->c_str() : nullptr;
  params.tdrz_enable = options.enable_spk && config_.get_diarize();
  if (options.enable_vad && config_.get_vad_enabled()) {
    params.vad = true;
    params.vad_model_path = config_.get_vad_model().c_str();
    params.vad_params.threshold = config_.get_vad_threshold();
  }

  steady_clock::time_point deadline;
  if (options.deadline) {
    deadline = *options.deadline;
    params.abort_callback = abort_on_deadline;
    params.abort_callback_user_data = &deadline;
  }

  std::unique_ptr<whisper_state, decltype(&whisper_free_state)> state(
      whisper_init_state(ctx_), whisper_free_state);
  if (!state) {
    throw std::runtime_error("cannot allocate whisper state");
  }

  int ret = whisper_full_with_state(ctx_, state.get(), params,
                                    audio.samples.data(),
                                    static_cast<int>(audio.samples.size()));
  if (ret != 0) {
    if (options.deadline && steady_clock::now() > deadline) {
      throw GatewayError(ErrorKind::recognition_timeout,
                         "transcription aborted at deadline");
    }
    throw std::runtime_error("whisper_full failed with code " +
                             std::to_string(ret));
  }

  RecognitionResult result;
  int n_segments = whisper_full_n_segments_from_state(state.get());
  for (int i = 0; i < n_segments; ++i) {
    SentenceSegment segment;
    segment.text = whisper_full_get_segment_text_from_state(state.get(), i);
    /* whisper timestamps are in units of 10 ms */
    segment.start_ms =
        whisper_full_get_segment_t0_from_state(state.get(), i) * 10;
    segment.end_ms = whisper_full_get_segment_t1_from_state(state.get(), i) * 10;
    segment.speaker_turn =
        whisper_full_get_segment_speaker_turn_next_from_state(state.get(), i);
    result.text += segment.text;
    boost::algorithm::trim(segment.text);
    result.segments.push_back(std::move(segment));
  }
  boost::algorithm::trim(result.text);

  const char *lang =
      whisper_lang_str(whisper_full_lang_id_from_state(state.get()));
  result.language = lang != nullptr ? lang : config_.get_language();

  BOOST_LOG_TRIVIAL(info) << "whisper:: " << path << " " << n_segments
                          << " segments, language " << result.language;
  return result;
}
