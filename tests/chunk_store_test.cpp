//
//  chunk_store_test.cpp
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
#include <vector>

#include "chunk_store.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

void testValidateKey() {
  ChunkStore::validate_key("d41d8cd98f00b204e9800998ecf8427e");
  ChunkStore::validate_key("upload-1_part.a");

  for (const std::string key : {"", "../etc", "a/../b", "a/b", "..", ".",
                                "a b", "a\\b", "key\n"}) {
    assert(throws_kind([&] { ChunkStore::validate_key(key); },
                       ErrorKind::invalid_key));
  }
  assert(throws_kind(
      [] { ChunkStore::validate_key(std::string(129, 'a')); },
      ErrorKind::invalid_key));
  ChunkStore::validate_key(std::string(128, 'a'));
}

void testTraversalRejectedBeforeAnyPath() {
  TempDir tmp;
  ChunkStore store(tmp.path() / "chunks");
  assert(throws_kind([&] { store.put("../escape", 0, "x"); },
                     ErrorKind::invalid_key));
  assert(throws_kind([&] { store.session_dir("../escape"); },
                     ErrorKind::invalid_key));
  assert(!fs::exists(tmp.path() / "escape"));
  assert(count_entries(store.root()) == 0);
}

void testChunkNames() {
  assert(ChunkStore::chunk_name(0) == "chunk_000000");
  assert(ChunkStore::chunk_name(42) == "chunk_000042");
  assert(ChunkStore::chunk_name(1234567) == "chunk_1234567");
  assert(*ChunkStore::parse_chunk_name("chunk_000042") == 42);
  assert(*ChunkStore::parse_chunk_name("chunk_1234567") == 1234567);
  assert(!ChunkStore::parse_chunk_name("session.json"));
  assert(!ChunkStore::parse_chunk_name("chunk_"));
  assert(!ChunkStore::parse_chunk_name("chunk_12a"));
  assert(!ChunkStore::parse_chunk_name("chunk_000001.tmp-abc"));
}

void testPutAndList() {
  TempDir tmp;
  ChunkStore store(tmp.path());
  auto ack = store.put("k1", 2, "cc");
  assert(ack.chunk_index == 2);
  assert(ack.bytes_written == 2);
  store.put("k1", 0, "a");
  store.put("k1", 1, "");

  assert((store.list("k1") == std::vector<uint64_t>{0, 1, 2}));
  assert(read_file(store.chunk_path("k1", 2)) == "cc");
  assert(fs::file_size(store.chunk_path("k1", 1)) == 0);
  assert(store.exists("k1"));
  assert(!store.exists("k2"));
}

void testListOrdersNumerically() {
  TempDir tmp;
  ChunkStore store(tmp.path());
  store.put("k", 1000000, "c");
  store.put("k", 999999, "b");
  store.put("k", 10, "a");
  assert((store.list("k") == std::vector<uint64_t>{10, 999999, 1000000}));
}

void testListIgnoresForeignFiles() {
  TempDir tmp;
  ChunkStore store(tmp.path());
  store.put("k", 0, "a");
  write_file(store.session_dir("k") / "session.json", "{}");
  write_file(store.session_dir("k") / "chunk_000001.tmp-xyz", "partial");
  assert((store.list("k") == std::vector<uint64_t>{0}));
}

void testOverwriteReplacesContent() {
  TempDir tmp;
  ChunkStore store(tmp.path());
  store.put("k", 0, "first payload");
  store.put("k", 0, "second");
  assert((store.list("k") == std::vector<uint64_t>{0}));
  assert(read_file(store.chunk_path("k", 0)) == "second");
  /* no leftover temporaries from the atomic write */
  assert(count_entries(store.session_dir("k")) == 1);
}

void testListMissingSession() {
  TempDir tmp;
  ChunkStore store(tmp.path());
  assert(throws_kind([&] { store.list("never"); },
                     ErrorKind::session_not_found));
}

void testCleanupIsIdempotent() {
  TempDir tmp;
  ChunkStore store(tmp.path());
  store.put("k", 0, "a");
  store.put("k", 1, "b");
  write_file(store.session_dir("k") / "merged.wav", "ab");

  store.cleanup("k");
  assert(!fs::exists(store.session_dir("k")));
  assert(throws_kind([&] { store.list("k"); }, ErrorKind::session_not_found));
  store.cleanup("k");
  store.cleanup("unknown");
}

void testCleanupPartialListsLeftovers() {
  TempDir tmp;
  StubbornStore store(tmp.path());
  store.put("k", 0, "a");
  store.put("k", 1, "b");
  store.keep.insert(ChunkStore::chunk_name(1));

  std::string what;
  try {
    store.cleanup("k");
  } catch (const GatewayError &e) {
    assert(e.kind() == ErrorKind::cleanup_partial);
    what = e.what();
  }
  assert(what.find("left 1 entries") != std::string::npos);
  assert(what.find(ChunkStore::chunk_name(1)) != std::string::npos);
  assert(what.find(ChunkStore::chunk_name(0)) == std::string::npos);
  assert((store.list("k") == std::vector<uint64_t>{1}));

  store.keep.clear();
  store.cleanup("k");
  assert(!store.exists("k"));
}

void testSessions() {
  TempDir tmp;
  ChunkStore store(tmp.path());
  store.put("a", 0, "x");
  store.put("b", 0, "y");
  fs::create_directories(tmp.path() / "not a key");
  write_file(tmp.path() / "stray", "z");

  auto keys = store.sessions();
  std::sort(keys.begin(), keys.end());
  assert((keys == std::vector<std::string>{"a", "b"}));
}

int main() {
  testValidateKey();
  testTraversalRejectedBeforeAnyPath();
  testChunkNames();
  testPutAndList();
  testListOrdersNumerically();
  testListIgnoresForeignFiles();
  testOverwriteReplacesContent();
  testListMissingSession();
  testCleanupIsIdempotent();
  testCleanupPartialListsLeftovers();
  testSessions();
  std::cout << "chunk_store_test: all tests passed\n";
  return 0;
}
