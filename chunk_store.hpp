//
//  chunk_store.hpp
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

#ifndef _CHUNK_STORE_HPP_
#define _CHUNK_STORE_HPP_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

struct PutAck {
  uint64_t chunk_index{0};
  uint64_t bytes_written{0};
};

/*
 * Durable staging of upload chunks, one directory per content key:
 *
 *   <root>/<content key>/chunk_000000
 *   <root>/<content key>/chunk_000001
 *   ...
 *
 * Index names are zero padded to kIndexWidth digits so a plain directory
 * listing is already ordered below 10^kIndexWidth, but every consumer
 * orders by the parsed index.
 */
class ChunkStore {
public:
  static constexpr int kIndexWidth = 6;
  static constexpr size_t kMaxKeyLength = 128;

  explicit ChunkStore(std::filesystem::path root);
  ChunkStore(const ChunkStore &) = delete;
  virtual ~ChunkStore() = default;

  /* throws GatewayError(invalid_key) for anything unsafe as a path */
  static void validate_key(const std::string &key);

  static std::string chunk_name(uint64_t index);
  static std::optional<uint64_t> parse_chunk_name(const std::string &name);

  /* store bytes as chunk index, replacing any previous copy */
  PutAck put(const std::string &key, uint64_t index, std::string_view bytes);

  /* ascending indices present, throws session_not_found */
  std::vector<uint64_t> list(const std::string &key) const;

  bool exists(const std::string &key) const;

  /* remove the whole session, throws cleanup_partial */
  void cleanup(const std::string &key);

  /* all session keys currently staged */
  std::vector<std::string> sessions() const;

  /* time of the last chunk or record written to the session */
  virtual std::filesystem::file_time_type
  last_activity(const std::string &key, std::error_code &ec) const;

  std::filesystem::path session_dir(const std::string &key) const;
  std::filesystem::path chunk_path(const std::string &key,
                                   uint64_t index) const;
  const std::filesystem::path &root() const { return root_; }

protected:
  /* remove one entry of a session directory, errors go to ec */
  virtual void remove_entry(const std::filesystem::path &path,
                            std::error_code &ec);

private:
  std::filesystem::path root_;
};

#endif
