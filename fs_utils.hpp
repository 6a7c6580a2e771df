//
//  fs_utils.hpp
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

#ifndef _FS_UTILS_HPP_
#define _FS_UTILS_HPP_

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

/* random token suitable for unique file names */
std::string unique_token();

/*
 * Write data to a temporary sibling of path, fsync it and rename it
 * over path. Readers never observe a partially written file.
 * Throws std::system_error.
 */
void write_file_atomic(const std::filesystem::path &path,
                       std::string_view data);

/* fsync a directory so that renames inside it are persisted */
void sync_directory(const std::filesystem::path &dir);

/*
 * Reduce a client supplied name to a single safe path component.
 * Returns fallback when nothing usable is left.
 */
std::string sanitize_filename(const std::string &name,
                              const std::string &fallback);

/* scoped file, removed when the owner goes out of scope */
class TempFile {
public:
  TempFile() = default;
  explicit TempFile(std::filesystem::path path) : path_(std::move(path)) {}
  TempFile(const TempFile &) = delete;
  TempFile &operator=(const TempFile &) = delete;
  TempFile(TempFile &&other) noexcept;
  TempFile &operator=(TempFile &&other) noexcept;
  ~TempFile();

  const std::filesystem::path &path() const { return path_; }
  bool empty() const { return path_.empty(); }

  /* remove now, returns false if the file could not be removed */
  bool remove();

private:
  std::filesystem::path path_;
};

#endif
