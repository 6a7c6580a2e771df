//
//  chunk_assembler.hpp
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

#ifndef _CHUNK_ASSEMBLER_HPP_
#define _CHUNK_ASSEMBLER_HPP_

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "chunk_store.hpp"
#include "upload_session.hpp"

class ChunkAssembler;

struct ChunkAck {
  uint64_t chunk_index{0};
  uint64_t bytes{0};
  std::string filename;
};

/*
 * Result of a merge. When cleanup was requested the artifact owns its
 * upload session and removes it, merged file included, on release()
 * or destruction. The assembler must outlive the artifact.
 */
class MergedArtifact {
public:
  MergedArtifact(const MergedArtifact &) = delete;
  MergedArtifact &operator=(const MergedArtifact &) = delete;
  MergedArtifact(MergedArtifact &&other) noexcept;
  ~MergedArtifact();

  const std::string &get_content_key() const { return content_key_; }
  const std::filesystem::path &get_path() const { return path_; }
  uint64_t get_size() const { return size_; }
  size_t get_chunk_count() const { return chunk_count_; }
  bool get_cleanup() const { return cleanup_; }

  /* run the pending cleanup now, false if it was only partial */
  bool release();

private:
  friend class ChunkAssembler;
  MergedArtifact(ChunkAssembler *owner, const std::string &content_key,
                 const std::filesystem::path &path, uint64_t size,
                 size_t chunk_count, bool cleanup)
      : owner_(owner), content_key_(content_key), path_(path), size_(size),
        chunk_count_(chunk_count), cleanup_(cleanup){};

  ChunkAssembler *owner_{nullptr};
  std::string content_key_;
  std::filesystem::path path_;
  uint64_t size_{0};
  size_t chunk_count_{0};
  bool cleanup_{false};
};

class ChunkAssembler {
public:
  static const std::string default_output_name;

  struct SweepStats {
    size_t sessions{0};
    size_t expired{0};
    size_t removed{0};
    size_t busy{0};
    size_t refreshed{0};
  };

  explicit ChunkAssembler(ChunkStore &store) : store_(store){};
  ChunkAssembler(const ChunkAssembler &) = delete;

  ChunkAck accept_chunk(const std::string &content_key, uint64_t chunk_index,
                        std::optional<uint64_t> total_chunks,
                        const std::string &display_name,
                        std::string_view bytes);

  /*
   * Concatenate all chunks of content_key in ascending index order.
   * The upload must be complete if a total is known, either passed
   * here or declared by a chunk upload.
   */
  MergedArtifact merge(const std::string &content_key,
                       const std::string &output_name, bool cleanup,
                       std::optional<uint64_t> expected_total = std::nullopt);

  /* remove a session, false if cleanup was only partial */
  bool cleanup(const std::string &content_key);

  /* snapshot of the session record with the chunks received so far */
  UploadSession get_session(const std::string &content_key);

  /* remove sessions idle for longer than max_age */
  SweepStats sweep_expired(std::chrono::seconds max_age);

  ChunkStore &get_store() { return store_; }

private:
  std::shared_ptr<std::mutex> session_mutex(const std::string &content_key);
  bool cleanup_locked(const std::string &content_key);

  ChunkStore &store_;
  std::mutex locks_mutex_;
  std::map<std::string, std::weak_ptr<std::mutex>> locks_;
};

#endif
