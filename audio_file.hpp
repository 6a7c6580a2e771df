//
//  audio_file.hpp
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

#ifndef _AUDIO_FILE_HPP_
#define _AUDIO_FILE_HPP_

#include <cstdint>
#include <string>
#include <vector>

struct PcmAudio {
  std::vector<float> samples; /* mono, -1.0 .. 1.0 */
  uint32_t sample_rate{0};
  uint16_t channels{0};
  uint16_t bits_per_sample{0};
};

/*
 * Decode any WAVE encoding dr_wav understands, integer or float PCM
 * and the A-law and mu-law variants. Channels are averaged down to
 * mono. Throws std::runtime_error on anything it cannot decode.
 */
PcmAudio read_wav(const std::string &path);

/* true if path holds a WAVE header, the content is not validated */
bool is_wav(const std::string &path);

/*
 * Convert any container ffmpeg understands to 16 kHz mono 16 bit PCM.
 * Throws std::runtime_error if ffmpeg is missing or fails.
 */
void convert_to_wav(const std::string &in, const std::string &out);

#endif
