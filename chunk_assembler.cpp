//
//  chunk_assembler.cpp
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

#include <fstream>
#include <sstream>

#include "chunk_assembler.hpp"
#include "errors.hpp"
#include "fs_utils.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

const std::string ChunkAssembler::default_output_name("merged_audio");

MergedArtifact::MergedArtifact(MergedArtifact &&other) noexcept
    : owner_(other.owner_), content_key_(std::move(other.content_key_)),
      path_(std::move(other.path_)), size_(other.size_),
      chunk_count_(other.chunk_count_), cleanup_(other.cleanup_) {
  other.owner_ = nullptr;
  other.cleanup_ = false;
}

MergedArtifact::~MergedArtifact() {
  try {
    release();
  } catch (const std::exception &e) {
    BOOST_LOG_TRIVIAL(error) << "chunk_assembler:: cleanup of "
                             << content_key_ << " failed: " << e.what();
  }
}

bool MergedArtifact::release() {
  if (!cleanup_ || owner_ == nullptr)
    return true;
  cleanup_ = false;
  return owner_->cleanup(content_key_);
}

std::shared_ptr<std::mutex>
ChunkAssembler::session_mutex(const std::string &content_key) {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  auto &weak = locks_[content_key];
  auto ptr = weak.lock();
  if (!ptr) {
    ptr = std::make_shared<std::mutex>();
    weak = ptr;
  }

  /* forget sessions nobody is working on */
  if (locks_.size() > 1024) {
    for (auto it = locks_.begin(); it != locks_.end();) {
      if (it->second.expired()) {
        it = locks_.erase(it);
      } else {
        ++it;
      }
    }
  }
  return ptr;
}

ChunkAck ChunkAssembler::accept_chunk(const std::string &content_key,
                                      uint64_t chunk_index,
                                      std::optional<uint64_t> total_chunks,
                                      const std::string &display_name,
                                      std::string_view bytes) {
  auto dir = store_.session_dir(content_key);
  auto mutex = session_mutex(content_key);
  std::lock_guard<std::mutex> lock(*mutex);

  auto session = UploadSession::load(dir);
  bool changed = !session;
  if (!session) {
    session = UploadSession(content_key);
  }
  /* reject a contradicting total before the chunk is stored */
  if (total_chunks) {
    changed |= session->declare_total(*total_chunks);
  }
  changed |= session->offer_display_name(display_name);

  auto ack = store_.put(content_key, chunk_index, bytes);
  if (changed) {
    session->save(dir);
  }

  BOOST_LOG_TRIVIAL(info) << "chunk_assembler:: accepted chunk "
                          << chunk_index << " of " << content_key << " ("
                          << bytes.size() << " bytes)";
  return ChunkAck{ack.chunk_index, ack.bytes_written,
                  session->get_display_name()};
}

MergedArtifact ChunkAssembler::merge(const std::string &content_key,
                                     const std::string &output_name,
                                     bool cleanup,
                                     std::optional<uint64_t> expected_total) {
  TimeElapsed te("chunk_assembler:: merge of " + content_key);
  auto dir = store_.session_dir(content_key);
  auto mutex = session_mutex(content_key);
  std::lock_guard<std::mutex> lock(*mutex);

  auto indices = store_.list(content_key);
  if (indices.empty()) {
    throw GatewayError(ErrorKind::no_chunks,
                       "no chunks uploaded for " + content_key);
  }

  auto session = UploadSession::load(dir).value_or(UploadSession(content_key));
  if (expected_total) {
    session.declare_total(*expected_total);
  }
  session.set_received_chunks(indices);
  if (session.get_expected_total() && !session.is_complete()) {
    std::ostringstream os;
    os << "upload " << content_key << " has " << indices.size()
       << " chunks, expected indices 0 to "
       << *session.get_expected_total() - 1;
    throw GatewayError(ErrorKind::incomplete_upload, os.str());
  }

  auto name = sanitize_filename(
      output_name.empty() ? session.get_display_name() : output_name,
      default_output_name);
  if (name == UploadSession::file_name ||
      ChunkStore::parse_chunk_name(name)) {
    name = "merged_" + name;
  }

  auto path = dir / name;
  auto part = path;
  part += ".part-" + unique_token();
  uint64_t size = 0;
  {
    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw GatewayError(ErrorKind::internal,
                         "cannot create merged file " + part.string());
    }
    for (auto index : indices) {
      auto chunk = store_.chunk_path(content_key, index);
      std::ifstream in(chunk, std::ios::binary);
      if (!in) {
        out.close();
        std::error_code ec;
        fs::remove(part, ec);
        throw GatewayError(ErrorKind::internal,
                           "cannot read chunk " + chunk.string());
      }
      auto chunk_size = fs::file_size(chunk);
      if (chunk_size > 0) {
        out << in.rdbuf();
      }
      size += chunk_size;
    }
    out.flush();
    if (!out) {
      out.close();
      std::error_code ec;
      fs::remove(part, ec);
      throw GatewayError(ErrorKind::internal,
                         "cannot write merged file " + part.string());
    }
  }
  fs::rename(part, path);

  BOOST_LOG_TRIVIAL(info) << "chunk_assembler:: merged " << indices.size()
                          << " chunks of " << content_key << " into " << path
                          << " (" << size << " bytes)";
  return MergedArtifact(this, content_key, path, size, indices.size(),
                        cleanup);
}

bool ChunkAssembler::cleanup(const std::string &content_key) {
  auto mutex = session_mutex(content_key);
  std::lock_guard<std::mutex> lock(*mutex);
  return cleanup_locked(content_key);
}

bool ChunkAssembler::cleanup_locked(const std::string &content_key) {
  try {
    store_.cleanup(content_key);
  } catch (const GatewayError &e) {
    if (e.kind() != ErrorKind::cleanup_partial)
      throw;
    BOOST_LOG_TRIVIAL(warning) << "chunk_assembler:: " << e.what();
    return false;
  }
  return true;
}

UploadSession ChunkAssembler::get_session(const std::string &content_key) {
  auto dir = store_.session_dir(content_key);
  auto mutex = session_mutex(content_key);
  std::lock_guard<std::mutex> lock(*mutex);

  auto indices = store_.list(content_key);
  auto session = UploadSession::load(dir).value_or(UploadSession(content_key));
  session.set_received_chunks(indices);
  return session;
}

ChunkAssembler::SweepStats
ChunkAssembler::sweep_expired(std::chrono::seconds max_age) {
  SweepStats stats;
  auto now = fs::file_time_type::clock::now();

  for (const auto &key : store_.sessions()) {
    stats.sessions++;
    std::error_code ec;
    auto last = store_.last_activity(key, ec);
    if (ec || now - last < max_age)
      continue;

    auto mutex = session_mutex(key);
    std::unique_lock<std::mutex> lock(*mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
      stats.busy++;
      continue;
    }
    /* a chunk may have landed between the first look and the lock */
    last = store_.last_activity(key, ec);
    if (ec || now - last < max_age) {
      stats.refreshed++;
      continue;
    }
    stats.expired++;

    BOOST_LOG_TRIVIAL(info) << "chunk_assembler:: removing expired session "
                            << key;
    if (cleanup_locked(key)) {
      stats.removed++;
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "chunk_assembler:: sweep checked "
                           << stats.sessions << " sessions, removed "
                           << stats.removed << " of " << stats.expired
                           << " expired";
  return stats;
}
