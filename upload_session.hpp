//
//  upload_session.hpp
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

#ifndef _UPLOAD_SESSION_HPP_
#define _UPLOAD_SESSION_HPP_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

/*
 * Metadata of one chunked upload, persisted as session.json next to
 * the chunks. The set of received chunks is never persisted, it is
 * always rebuilt from the staging directory.
 */
class UploadSession {
public:
  static const char *const file_name;

  UploadSession() = default;
  explicit UploadSession(const std::string &content_key)
      : content_key_(content_key){};

  /* returns nullopt when the session has no record yet */
  static std::optional<UploadSession> load(const std::filesystem::path &dir);
  void save(const std::filesystem::path &dir) const;

  const std::string &get_content_key() const { return content_key_; }
  const std::string &get_display_name() const { return display_name_; }
  std::optional<uint64_t> get_expected_total() const { return expected_total_; }
  const std::set<uint64_t> &get_received_chunks() const { return received_; }

  /* first non-empty name wins, returns true if the record changed */
  bool offer_display_name(const std::string &name);

  /*
   * First declared total wins, returns true if the record changed.
   * Throws GatewayError(inconsistent_total) if total contradicts it.
   */
  bool declare_total(uint64_t total);

  void set_received_chunks(const std::vector<uint64_t> &indices) {
    received_ = std::set<uint64_t>(indices.begin(), indices.end());
  }

  /* exactly the indices 0 .. total-1 are present */
  bool is_complete() const {
    return expected_total_ && !received_.empty() &&
           received_.size() == *expected_total_ &&
           *received_.rbegin() == *expected_total_ - 1;
  }

private:
  std::string content_key_;
  std::string display_name_;
  std::optional<uint64_t> expected_total_;
  std::set<uint64_t> received_;
};

#endif
