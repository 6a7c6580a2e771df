//
//  api_test.cpp
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

#include <memory>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "api.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace std::chrono_literals;

using HeaderList = std::vector<std::pair<std::string, std::string>>;

static const std::string api_key("test-key");

struct Field {
  std::string name;
  std::string value;
  std::string filename;
};

static httplib::Request make_request(const std::string &method,
                                     const std::string &path,
                                     const std::string &body = "",
                                     const HeaderList &headers = {},
                                     bool authorized = true) {
  httplib::Request req;
  req.method = method;
  req.path = path;
  req.body = body;
  if (authorized) {
    req.headers.emplace("Authorization", "Bearer " + api_key);
  }
  for (const auto &h : headers) {
    req.headers.emplace(h.first, h.second);
  }
  return req;
}

/* what the server hands over once a multipart body has been parsed */
static httplib::Request form_request(const std::string &path,
                                     const std::vector<Field> &fields) {
  auto req = make_request(
      "POST", path, "",
      {{"Content-Type", "multipart/form-data; boundary=gatewaytestboundary"}});
  for (const auto &f : fields) {
    if (f.filename.empty()) {
      httplib::FormField field;
      field.name = f.name;
      field.content = f.value;
      req.form.fields.emplace(f.name, field);
    } else {
      httplib::FormData file;
      file.name = f.name;
      file.content = f.value;
      file.filename = f.filename;
      file.content_type = "application/octet-stream";
      req.form.files.emplace(f.name, file);
    }
  }
  return req;
}

struct Fixture {
  TempDir tmp;
  Config config;
  std::shared_ptr<FakeRecognizer> fake{std::make_shared<FakeRecognizer>()};
  StubbornStore store{tmp.path() / "chunks"};
  ChunkAssembler assembler{store};
  RemoteFetcher fetcher{tmp.path() / "tmp", 30s, true};
  TranscriptionGateway gateway{fake, 60s};
  std::unique_ptr<Api> api;

  Fixture() {
    config.set_api_key(api_key);
    api = std::make_unique<Api>(config, assembler, fetcher, gateway,
                                tmp.path() / "tmp");
  }

  httplib::Response send(const httplib::Request &req) {
    httplib::Response res;
    api->handle(req, res);
    return res;
  }

  httplib::Response request(const std::string &method, const std::string &path,
                            const std::string &body = "",
                            const HeaderList &headers = {},
                            bool authorized = true) {
    return send(make_request(method, path, body, headers, authorized));
  }

  httplib::Response post_json(const std::string &path, const json &j) {
    return request("POST", path, j.dump(),
                   {{"Content-Type", "application/json"}});
  }

  httplib::Response post_form(const std::string &path,
                              const std::vector<Field> &fields) {
    return send(form_request(path, fields));
  }

  httplib::Response post_chunk(const std::string &key, uint64_t index,
                               const std::string &data,
                               const std::string &total = "",
                               const std::string &filename = "") {
    HeaderList headers{{"upload-file-md5", key},
                       {"upload-chunk-index", std::to_string(index)}};
    if (!total.empty()) {
      headers.emplace_back("upload-total-chunks", total);
    }
    if (!filename.empty()) {
      headers.emplace_back("upload-filename", filename);
    }
    return request("POST", "/v1/audio/chunk", data, headers);
  }
};

static void expect_error(const httplib::Response &res, int status,
                         const std::string &kind) {
  if (res.status != status) {
    std::cerr << "expected " << status << ", got " << res.status << ": "
              << res.body << '\n';
  }
  assert(res.status == status);
  assert(res.get_header_value("Content-Type") == "application/json");
  auto j = json::parse(res.body);
  assert(j["detail"].is_string());
  assert(j["error"]["kind"] == kind);
}

void testHealth() {
  Fixture f;
  auto res = f.request("GET", "/", "", {}, false);
  assert(res.status == 200);
  assert(json::parse(res.body)["status"] == "ok");

  expect_error(f.request("POST", "/"), 405, "method_not_allowed");
  expect_error(f.request("GET", "/v1/audio/merge"), 405,
               "method_not_allowed");
  expect_error(f.request("GET", "/nowhere", "", {}, false), 404,
               "not_found");
}

void testAuthRejectedWithoutSideEffects() {
  Fixture f;
  auto res = f.request("POST", "/v1/audio/chunk", "abc",
                       {{"upload-file-md5", "k"}, {"upload-chunk-index", "0"}},
                       false);
  expect_error(res, 401, "auth_error");
  assert(res.get_header_value("WWW-Authenticate") == "Bearer");
  assert(json::parse(res.body)["detail"] ==
         "Authorization header is missing");

  for (auto value : {"Bearer wrong-token", "Basic test-key", "Bearer",
                     "test-key", "Bearer test-key2"}) {
    res = f.request("POST", "/v1/audio/chunk", "abc",
                    {{"Authorization", value},
                     {"upload-file-md5", "k"},
                     {"upload-chunk-index", "0"}},
                    false);
    expect_error(res, 401, "auth_error");
    assert(json::parse(res.body)["detail"] == "Invalid API Key");
  }
  assert(!f.store.exists("k"));

  res = f.request("POST", "/v1/audio/merge", "{\"fileMd5\":\"k\"}",
                  {{"Authorization", "Bearer wrong-token"}}, false);
  expect_error(res, 401, "auth_error");
  assert(f.fake->calls == 0);

  /* the scheme is case insensitive */
  res = f.request("POST", "/v1/audio/chunk", "abc",
                  {{"Authorization", "bearer test-key"},
                   {"upload-file-md5", "k"},
                   {"upload-chunk-index", "0"}},
                  false);
  assert(res.status == 200);
}

void testRawChunkUpload() {
  Fixture f;
  auto res = f.post_chunk("abc123", 0, "hello", "2", "talk.wav");
  assert(res.status == 200);
  auto j = json::parse(res.body);
  assert(j["status"] == "ok");
  assert(j["chunk_index"] == 0);
  assert(j["filename"] == "talk.wav");
  assert(j["bytes"] == 5);
  assert(read_file(f.store.chunk_path("abc123", 0)) == "hello");

  /* an empty chunk is a valid chunk */
  res = f.post_chunk("abc123", 1, "");
  assert(res.status == 200);
  assert(json::parse(res.body)["bytes"] == 0);
  assert((f.store.list("abc123") == std::vector<uint64_t>{0, 1}));
}

void testMultipartChunkUpload() {
  Fixture f;
  auto res = f.post_form("/v1/audio/chunk", {{"fileMd5", "key1", ""},
                                             {"chunkIndex", "3", ""},
                                             {"totalChunks", "4", ""},
                                             {"file", "part-three", "blob.wav"}});
  assert(res.status == 200);
  auto j = json::parse(res.body);
  assert(j["chunk_index"] == 3);
  assert(j["filename"] == "blob.wav");
  assert(read_file(f.store.chunk_path("key1", 3)) == "part-three");
  assert(*f.assembler.get_session("key1").get_expected_total() == 4);

  /* the upload name is taken whole, separators included */
  res = f.post_form("/v1/audio/chunk", {{"fileMd5", "key2", ""},
                                        {"chunkIndex", "0", ""},
                                        {"file", "x", "a;b.wav"}});
  assert(res.status == 200);
  assert(json::parse(res.body)["filename"] == "ab.wav");

  expect_error(f.post_form("/v1/audio/chunk",
                           {{"fileMd5", "key3", ""}, {"chunkIndex", "0", ""}}),
               400, "validation_error");
  expect_error(f.post_form("/v1/audio/chunk",
                           {{"chunkIndex", "0", ""}, {"file", "x", "a.wav"}}),
               400, "validation_error");
  assert(!f.store.exists("key3"));
}

void testChunkValidation() {
  Fixture f;
  expect_error(f.request("POST", "/v1/audio/chunk", "abc"), 400,
               "validation_error");
  assert(json::parse(f.request("POST", "/v1/audio/chunk", "abc")
                         .body)["detail"] == "Missing chunk upload headers");

  expect_error(f.request("POST", "/v1/audio/chunk", "abc",
                         {{"upload-file-md5", "k"}}),
               400, "validation_error");
  expect_error(f.request("POST", "/v1/audio/chunk", "abc",
                         {{"upload-file-md5", "k"},
                          {"upload-chunk-index", "-1"}}),
               400, "validation_error");
  expect_error(f.request("POST", "/v1/audio/chunk", "abc",
                         {{"upload-file-md5", "k"},
                          {"upload-chunk-index", "x1"}}),
               400, "validation_error");
  expect_error(f.post_chunk("k", 0, "abc", "0"), 400, "validation_error");
  expect_error(f.post_chunk("k", 0, "abc", "many"), 400, "validation_error");
  assert(!f.store.exists("k"));

  expect_error(f.post_chunk("../../etc", 0, "abc"), 400, "invalid_key");
  expect_error(f.post_chunk("a/b", 0, "abc"), 400, "invalid_key");
  assert(count_entries(f.store.root()) == 0);

  f.post_chunk("k", 0, "abc", "2");
  expect_error(f.post_chunk("k", 1, "def", "3"), 400, "inconsistent_total");
}

void testMergeFlow() {
  Fixture f;
  f.post_chunk("flow", 1, "-world", "2");
  f.post_chunk("flow", 0, "hello", "2", "greeting.wav");

  auto res = f.post_json("/v1/audio/merge",
                         {{"fileMd5", "flow"}, {"prompt", "greetings"}});
  assert(res.status == 200);
  assert(res.get_header_value("Content-Type") == "application/json");
  auto j = json::parse(res.body);
  assert(j["text"] == FakeRecognizer::sample().text);
  assert(j["segments"].size() == 2);
  assert(j["language"] == "en");

  assert(f.fake->calls == 1);
  assert(f.fake->last_audio == "hello-world");
  assert(fs::path(f.fake->last_path).filename() == "greeting.wav");
  assert(*f.fake->last_options.hotword == "greetings");

  /* cleanup defaults to true */
  assert(!f.store.exists("flow"));
  assert(!fs::exists(f.fake->last_path));
}

void testMergeWithoutCleanup() {
  Fixture f;
  f.post_chunk("keep", 0, "abc");
  auto res = f.post_json("/v1/audio/merge", {{"fileMd5", "keep"},
                                             {"filename", "out.wav"},
                                             {"cleanup", false}});
  assert(res.status == 200);
  assert(f.store.exists("keep"));
  assert(read_file(f.store.session_dir("keep") / "out.wav") == "abc");
}

void testMergeErrors() {
  Fixture f;
  expect_error(f.post_json("/v1/audio/merge", {{"fileMd5", "never"}}), 400,
               "session_not_found");
  expect_error(f.post_json("/v1/audio/merge", json::object()), 400,
               "validation_error");
  expect_error(f.post_json("/v1/audio/merge", {{"fileMd5", 5}}), 400,
               "validation_error");
  expect_error(f.request("POST", "/v1/audio/merge", "{not json"),
               400, "validation_error");
  expect_error(f.post_json("/v1/audio/merge", {{"fileMd5", "../x"}}), 400,
               "invalid_key");

  f.post_chunk("part", 0, "a", "3");
  expect_error(f.post_json("/v1/audio/merge", {{"fileMd5", "part"}}), 400,
               "incomplete_upload");
  assert(f.store.exists("part"));
  expect_error(f.post_json("/v1/audio/merge",
                           {{"fileMd5", "part"}, {"totalChunks", 2}}),
               400, "inconsistent_total");
  assert(f.fake->calls == 0);
}

void testMergeRecognitionFailureStillCleansUp() {
  Fixture f;
  f.fake->failure = "decoder error";
  f.post_chunk("bad", 0, "abc");
  auto res = f.post_json("/v1/audio/merge", {{"fileMd5", "bad"}});
  expect_error(res, 500, "recognition_failure");
  assert(json::parse(res.body)["detail"] ==
         "An error occurred during transcription: decoder error");
  assert(!f.store.exists("bad"));
}

void testFromUrl() {
  Fixture f;
  auto source = f.tmp.path() / "remote.wav";
  write_file(source, "remote-bytes");

  auto res = f.post_json("/v1/audio/from_url",
                         {{"url", "file://" + source.string()},
                          {"response_format", "text"},
                          {"headers", {{"X-Token", "abc"}}}});
  assert(res.status == 200);
  assert(res.get_header_value("Content-Type") == "text/plain; charset=utf-8");
  assert(res.body == FakeRecognizer::sample().text);
  assert(f.fake->last_audio == "remote-bytes");
  assert(fs::path(f.fake->last_path).filename().string().find("remote.wav") !=
         std::string::npos);
  /* the downloaded copy does not outlive the request */
  assert(count_entries(f.tmp.path() / "tmp") == 0);

  res = f.post_json("/v1/audio/from_url",
                    {{"url", "file://" + source.string()},
                     {"filename", "named.mp3"}});
  assert(res.status == 200);
  assert(json::parse(res.body) == json({{"text", f.fake->result.text}}));
  assert(fs::path(f.fake->last_path).extension() == ".mp3");
}

void testFromUrlErrors() {
  Fixture f;
  expect_error(f.post_json("/v1/audio/from_url", json::object()), 400,
               "validation_error");
  expect_error(f.post_json("/v1/audio/from_url", {{"url", "ftp://x/a.wav"}}),
               400, "validation_error");
  expect_error(f.post_json("/v1/audio/from_url",
                           {{"url", "http://x/a.wav"}, {"headers", "x"}}),
               400, "validation_error");
  expect_error(f.post_json("/v1/audio/from_url",
                           {{"url", "http://x/a.wav"},
                            {"headers", {{"X-Bad", "a\r\nInjected: 1"}}}}),
               400, "validation_error");
  expect_error(f.post_json("/v1/audio/from_url",
                           {{"url", "http://x/a.wav"},
                            {"response_format", "xml"}}),
               400, "validation_error");

  auto res = f.post_json(
      "/v1/audio/from_url",
      {{"url", "file://" + (f.tmp.path() / "missing.wav").string()}});
  expect_error(res, 500, "fetch_error");
  assert(count_entries(f.tmp.path() / "tmp") == 0);
  assert(f.fake->calls == 0);

  auto source = f.tmp.path() / "remote.wav";
  write_file(source, "remote-bytes");
  f.fake->failure = "boom";
  res = f.post_json("/v1/audio/from_url",
                    {{"url", "file://" + source.string()}});
  expect_error(res, 500, "recognition_failure");
  assert(count_entries(f.tmp.path() / "tmp") == 0);
}

void testTranscriptions() {
  Fixture f;
  auto res = f.post_form("/v1/audio/transcriptions",
                         {{"file", "uploaded-audio", "in.wav"},
                          {"model", "whisper-1", ""},
                          {"response_format", "srt", ""},
                          {"prompt", "names", ""}});
  assert(res.status == 200);
  assert(res.get_header_value("Content-Type") == "text/plain; charset=utf-8");
  assert(res.body.rfind("1\n00:00:00,000 --> 00:00:01,500\n", 0) == 0);
  assert(f.fake->last_audio == "uploaded-audio");
  assert(*f.fake->last_options.hotword == "names");
  assert(count_entries(f.tmp.path() / "tmp") == 0);

  res = f.post_form("/v1/audio/transcriptions",
                    {{"file", "x", "in.wav"}, {"model", "whisper-1", ""}});
  assert(res.status == 200);
  assert(json::parse(res.body)["text"] == f.fake->result.text);

  expect_error(f.post_form("/v1/audio/transcriptions",
                           {{"file", "x", "in.wav"}}),
               400, "validation_error");
  expect_error(f.post_form("/v1/audio/transcriptions",
                           {{"model", "whisper-1", ""}}),
               400, "validation_error");
  expect_error(f.post_form("/v1/audio/transcriptions",
                           {{"file", "x", "in.wav"},
                            {"model", "whisper-1", ""},
                            {"response_format", "docx", ""}}),
               400, "validation_error");
  res = f.request("POST", "/v1/audio/transcriptions", "{}",
                  {{"Content-Type", "application/json"}});
  expect_error(res, 400, "validation_error");
  assert(json::parse(res.body)["detail"] == "Expected multipart/form-data");
}

void testTranscriptionTimeout() {
  Fixture f;
  f.fake->failure = "aborted";
  f.fake->delay = 1200ms;
  TranscriptionGateway gateway(f.fake, 1s);
  Api api(f.config, f.assembler, f.fetcher, gateway, f.tmp.path() / "tmp");

  auto req = form_request("/v1/audio/transcriptions",
                          {{"file", "x", "in.wav"}, {"model", "m", ""}});
  httplib::Response res;
  api.handle(req, res);
  expect_error(res, 504, "recognition_timeout");
}

void testMergeSucceedsWhenCleanupIsPartial() {
  Fixture f;
  f.post_chunk("sticky", 0, "abc");
  f.store.keep.insert(ChunkStore::chunk_name(0));

  auto res = f.post_json("/v1/audio/merge", {{"fileMd5", "sticky"}});
  assert(res.status == 200);
  assert(json::parse(res.body)["text"] == f.fake->result.text);
  /* the transcript wins, the leftover waits for the sweep */
  assert((f.store.list("sticky") == std::vector<uint64_t>{0}));
  assert(!fs::exists(f.fake->last_path));
}

void testErrorResponse() {
  httplib::Response res;
  Api::error_response(res, ErrorKind::payload_too_large,
                      "Request body too large");
  expect_error(res, 413, "payload_too_large");

  httplib::Response auth;
  Api::error_response(auth, ErrorKind::auth, "Invalid API Key");
  expect_error(auth, 401, "auth_error");
  assert(auth.get_header_value("WWW-Authenticate") == "Bearer");
}

int main() {
  testHealth();
  testAuthRejectedWithoutSideEffects();
  testRawChunkUpload();
  testMultipartChunkUpload();
  testChunkValidation();
  testMergeFlow();
  testMergeWithoutCleanup();
  testMergeErrors();
  testMergeRecognitionFailureStillCleansUp();
  testFromUrl();
  testFromUrlErrors();
  testTranscriptions();
  testTranscriptionTimeout();
  testMergeSucceedsWhenCleanupIsPartial();
  testErrorResponse();
  std::cout << "api_test: all tests passed\n";
  return 0;
}
