//
//  utils.hpp
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

#ifndef _UTILS_HPP_
#define _UTILS_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/lexical_cast.hpp>

#include "log.hpp"

class TimeElapsed {
public:
  TimeElapsed() = delete;
  TimeElapsed(const std::string &desc) {
    desc_ = desc;
    start_ = std::chrono::steady_clock::now();
  }

  uint32_t elapsed() const {
    auto end = std::chrono::steady_clock::now();
    std::chrono::duration<double, std::milli> elapsed = end - start_;
    return elapsed.count();
  }

  ~TimeElapsed() {
    BOOST_LOG_TRIVIAL(info) << desc_ << " returned in " << elapsed() << " ms";
  }

private:
  std::chrono::steady_clock::time_point start_;
  std::string desc_;
};

/* parse a non-negative decimal integer, digits only */
inline std::optional<uint64_t> parse_index(const std::string &str) {
  if (str.empty() || str.size() > 19 ||
      str.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return boost::lexical_cast<uint64_t>(str);
  } catch (const boost::bad_lexical_cast &) {
    return std::nullopt;
  }
}

#endif
