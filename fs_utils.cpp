//
//  fs_utils.cpp
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

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cctype>
#include <cerrno>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

#include "fs_utils.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

std::string unique_token() {
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

static void close_fd(int fd, const fs::path &path) {
  if (::close(fd) != 0) {
    throw std::system_error(errno, std::generic_category(),
                            "close " + path.string());
  }
}

void write_file_atomic(const fs::path &path, std::string_view data) {
  fs::path tmp = path;
  tmp += ".tmp-" + unique_token();

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(),
                            "open " + tmp.string());
  }

  const char *ptr = data.data();
  size_t left = data.size();
  while (left > 0) {
    ssize_t n = ::write(fd, ptr, left);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      int err = errno;
      ::close(fd);
      std::error_code ec;
      fs::remove(tmp, ec);
      throw std::system_error(err, std::generic_category(),
                              "write " + tmp.string());
    }
    ptr += n;
    left -= static_cast<size_t>(n);
  }

  if (::fsync(fd) != 0) {
    int err = errno;
    ::close(fd);
    std::error_code ec;
    fs::remove(tmp, ec);
    throw std::system_error(err, std::generic_category(),
                            "fsync " + tmp.string());
  }
  close_fd(fd, tmp);

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    std::error_code rm_ec;
    fs::remove(tmp, rm_ec);
    throw std::system_error(ec, "rename " + tmp.string());
  }
  sync_directory(path.parent_path());
}

void sync_directory(const fs::path &dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(),
                            "open " + dir.string());
  }
  if (::fsync(fd) != 0) {
    int err = errno;
    ::close(fd);
    throw std::system_error(err, std::generic_category(),
                            "fsync " + dir.string());
  }
  close_fd(fd, dir);
}

std::string sanitize_filename(const std::string &name,
                              const std::string &fallback) {
  std::string base = name;
  auto pos = base.find_last_of("/\\");
  if (pos != std::string::npos) {
    base = base.substr(pos + 1);
  }

  std::string out;
  for (unsigned char c : base) {
    if (std::isalnum(c) || c == '.' || c == '-' || c == '_') {
      out.push_back(static_cast<char>(c));
    } else if (c >= 0x80 || c == ' ') {
      out.push_back('_');
    }
  }

  if (out.size() > 200) {
    out.erase(0, out.size() - 200);
  }
  if (out.empty() || out.find_first_not_of('.') == std::string::npos) {
    return fallback;
  }
  return out;
}

TempFile::TempFile(TempFile &&other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

TempFile &TempFile::operator=(TempFile &&other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

TempFile::~TempFile() { remove(); }

bool TempFile::remove() {
  if (path_.empty())
    return true;

  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "temp_file:: cannot remove " << path_
                               << ": " << ec.message();
    return false;
  }
  BOOST_LOG_TRIVIAL(debug) << "temp_file:: removed " << path_;
  path_.clear();
  return true;
}
