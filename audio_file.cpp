//
//  audio_file.cpp
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

#include <boost/process.hpp>

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

#include <cstdint>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <vector>

#include "audio_file.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace bp = boost::process;

/* frames decoded per read, bounds memory use for bogus headers */
static constexpr drwav_uint64 frames_per_read = 16384;

bool is_wav(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  char header[12];
  if (!in.read(header, sizeof(header)))
    return false;
  return std::memcmp(header, "RIFF", 4) == 0 &&
         std::memcmp(header + 8, "WAVE", 4) == 0;
}

PcmAudio read_wav(const std::string &path) {
  drwav wav;
  if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
    throw std::runtime_error("cannot decode WAVE file " + path);
  }
  if (wav.channels == 0) {
    drwav_uninit(&wav);
    throw std::runtime_error(path + ": no audio channels");
  }

  PcmAudio audio;
  audio.sample_rate = wav.sampleRate;
  audio.channels = wav.channels;
  audio.bits_per_sample = wav.bitsPerSample;

  /* the declared frame count is not trusted, read until the data ends */
  std::vector<float> pcm(frames_per_read * wav.channels);
  drwav_uint64 frames;
  while ((frames = drwav_read_pcm_frames_f32(&wav, frames_per_read,
                                             pcm.data())) > 0) {
    for (drwav_uint64 frame = 0; frame < frames; frame++) {
      float pcmFloat{0};
      for (uint16_t ch = 0; ch < audio.channels; ch++) {
        pcmFloat += pcm[frame * audio.channels + ch];
      }
      audio.samples.push_back(pcmFloat / audio.channels);
    }
  }
  drwav_uninit(&wav);

  BOOST_LOG_TRIVIAL(debug) << "audio_file:: " << path << " "
                           << audio.samples.size() << " frames at "
                           << audio.sample_rate << " Hz, " << audio.channels
                           << " channels";
  return audio;
}

void convert_to_wav(const std::string &in, const std::string &out) {
  TimeElapsed te("audio_file:: ffmpeg conversion");
  auto ffmpeg = bp::search_path("ffmpeg");
  if (ffmpeg.empty()) {
    throw std::runtime_error("ffmpeg not found, cannot convert " + in);
  }

  bp::ipstream err;
  bp::child c(ffmpeg, "-nostdin", "-loglevel", "error", "-i", in, "-y", "-ar",
              "16000", "-ac", "1", "-c:a", "pcm_s16le", out,
              bp::std_in < bp::null, bp::std_out > bp::null, bp::std_err > err);

  std::string line, message;
  while (std::getline(err, line)) {
    if (!line.empty()) {
      message = line;
    }
  }
  c.wait();

  if (c.exit_code() != 0) {
    throw std::runtime_error("ffmpeg failed on " + in + ": " + message);
  }
}
