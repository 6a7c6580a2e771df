//
//  chunk_store.cpp
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

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

#include "chunk_store.hpp"
#include "errors.hpp"
#include "fs_utils.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

static const std::string chunk_prefix("chunk_");

ChunkStore::ChunkStore(fs::path root) : root_(std::move(root)) {
  fs::create_directories(root_);
  BOOST_LOG_TRIVIAL(debug) << "chunk_store:: staging root " << root_;
}

void ChunkStore::validate_key(const std::string &key) {
  if (key.empty()) {
    throw GatewayError(ErrorKind::invalid_key, "content key is empty");
  }
  if (key.size() > kMaxKeyLength) {
    throw GatewayError(ErrorKind::invalid_key, "content key is too long");
  }
  if (key.find("..") != std::string::npos) {
    throw GatewayError(ErrorKind::invalid_key,
                       "content key contains a path traversal sequence");
  }
  for (unsigned char c : key) {
    if (!std::isalnum(c) && c != '-' && c != '_' && c != '.') {
      throw GatewayError(ErrorKind::invalid_key,
                         "content key contains a forbidden character");
    }
  }
  if (key == ".") {
    throw GatewayError(ErrorKind::invalid_key, "content key is not a name");
  }
}

std::string ChunkStore::chunk_name(uint64_t index) {
  std::ostringstream os;
  os << chunk_prefix << std::setw(kIndexWidth) << std::setfill('0') << index;
  return os.str();
}

std::optional<uint64_t> ChunkStore::parse_chunk_name(const std::string &name) {
  if (name.compare(0, chunk_prefix.size(), chunk_prefix) != 0) {
    return std::nullopt;
  }
  return parse_index(name.substr(chunk_prefix.size()));
}

fs::path ChunkStore::session_dir(const std::string &key) const {
  validate_key(key);
  return root_ / key;
}

fs::path ChunkStore::chunk_path(const std::string &key, uint64_t index) const {
  return session_dir(key) / chunk_name(index);
}

PutAck ChunkStore::put(const std::string &key, uint64_t index,
                       std::string_view bytes) {
  auto dir = session_dir(key);
  fs::create_directories(dir);
  write_file_atomic(dir / chunk_name(index), bytes);

  BOOST_LOG_TRIVIAL(debug) << "chunk_store:: stored chunk " << index << " of "
                           << key << " (" << bytes.size() << " bytes)";
  return PutAck{index, bytes.size()};
}

std::vector<uint64_t> ChunkStore::list(const std::string &key) const {
  auto dir = session_dir(key);
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw GatewayError(ErrorKind::session_not_found,
                       "no upload session for " + key);
  }

  std::vector<uint64_t> indices;
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file())
      continue;
    auto index = parse_chunk_name(entry.path().filename().string());
    if (index) {
      indices.push_back(*index);
    }
  }
  std::sort(indices.begin(), indices.end());
  indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
  return indices;
}

bool ChunkStore::exists(const std::string &key) const {
  std::error_code ec;
  return fs::is_directory(session_dir(key), ec);
}

void ChunkStore::cleanup(const std::string &key) {
  auto dir = session_dir(key);
  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    return;
  }

  std::vector<std::string> failed;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code rm_ec;
    remove_entry(it->path(), rm_ec);
    if (rm_ec) {
      BOOST_LOG_TRIVIAL(warning) << "chunk_store:: cannot remove "
                                 << it->path() << ": " << rm_ec.message();
      failed.push_back(it->path().filename().string());
    }
  }
  if (ec) {
    failed.push_back(dir.filename().string() + " (" + ec.message() + ")");
  }

  if (failed.empty()) {
    fs::remove(dir, ec);
    if (ec) {
      failed.push_back(dir.filename().string());
    }
  }

  if (!failed.empty()) {
    std::ostringstream os;
    os << "cleanup of " << key << " left " << failed.size() << " entries:";
    for (const auto &name : failed) {
      os << ' ' << name;
    }
    throw GatewayError(ErrorKind::cleanup_partial, os.str());
  }
  BOOST_LOG_TRIVIAL(debug) << "chunk_store:: removed session " << key;
}

std::vector<std::string> ChunkStore::sessions() const {
  std::vector<std::string> keys;
  std::error_code ec;
  for (fs::directory_iterator it(root_, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_directory())
      continue;
    auto key = it->path().filename().string();
    try {
      validate_key(key);
      keys.push_back(key);
    } catch (const GatewayError &) {
      BOOST_LOG_TRIVIAL(warning)
          << "chunk_store:: ignoring foreign directory " << it->path();
    }
  }
  return keys;
}

fs::file_time_type ChunkStore::last_activity(const std::string &key,
                                             std::error_code &ec) const {
  return fs::last_write_time(session_dir(key), ec);
}

void ChunkStore::remove_entry(const fs::path &path, std::error_code &ec) {
  fs::remove_all(path, ec);
}
