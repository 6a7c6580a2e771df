//
//  api.cpp
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

#include <boost/algorithm/string.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <map>
#include <optional>

#include "api.hpp"
#include "fs_utils.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

static GatewayError invalid(const std::string &detail) {
  return GatewayError(ErrorKind::validation, detail);
}

/* comparison time does not depend on where the strings differ */
static bool equal_secret(const std::string &a, const std::string &b) {
  if (a.size() != b.size() || b.empty())
    return false;
  unsigned char diff = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<unsigned char>(a[i] ^ b[i]);
  }
  return diff == 0;
}

static std::optional<std::string> optional_string(const json &j,
                                                  const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  if (!it->is_string())
    throw invalid(std::string("'") + key + "' must be a string");
  return it->get<std::string>();
}

static std::optional<bool> optional_bool(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  if (!it->is_boolean())
    throw invalid(std::string("'") + key + "' must be a boolean");
  return it->get<bool>();
}

static std::optional<uint64_t> optional_count(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  if (!it->is_number_unsigned() || it->get<uint64_t>() == 0)
    throw invalid(std::string("'") + key + "' must be a positive integer");
  return it->get<uint64_t>();
}

/* text field of a multipart form, nullopt when absent */
static std::optional<std::string> form_field(const httplib::Request &req,
                                             const char *name) {
  if (!req.form.has_field(name))
    return std::nullopt;
  return req.form.get_field(name);
}

static json parse_json_body(const httplib::Request &req) {
  auto j = json::parse(req.body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw invalid("Request body must be a JSON object");
  }
  return j;
}

static ResponseFormat response_format(const std::optional<std::string> &name) {
  if (!name || name->empty())
    return ResponseFormat::json;
  auto format = parse_response_format(*name);
  if (!format) {
    throw invalid("Unsupported response_format '" + *name + "'");
  }
  return *format;
}

static std::optional<uint64_t> parse_total(const std::string &value) {
  if (value.empty())
    return std::nullopt;
  auto total = parse_index(value);
  if (!total || *total == 0) {
    throw invalid("Invalid total chunks '" + value + "'");
  }
  return total;
}

static void json_response(httplib::Response &res, const json &j) {
  res.status = 200;
  res.set_content(j.dump(-1, ' ', false, json::error_handler_t::replace),
                  "application/json");
}

static void rendered_response(httplib::Response &res, RenderedBody rendered) {
  res.status = 200;
  res.set_content(std::move(rendered.body), rendered.content_type);
}

Api::Api(const Config &config, ChunkAssembler &assembler,
         RemoteFetcher &fetcher, TranscriptionGateway &gateway,
         const fs::path &upload_dir)
    : config_(config), assembler_(assembler), fetcher_(fetcher),
      gateway_(gateway), upload_dir_(upload_dir) {
  fs::create_directories(upload_dir_);
}

void Api::error_response(httplib::Response &res, ErrorKind kind,
                         const std::string &detail) {
  json j{{"detail", detail}, {"error", {{"kind", to_string(kind)}}}};
  res.status = static_cast<int>(http_status(kind));
  if (kind == ErrorKind::auth) {
    res.set_header("WWW-Authenticate", "Bearer");
  }
  res.set_content(j.dump(-1, ' ', false, json::error_handler_t::replace),
                  "application/json");
}

void Api::authorize(const httplib::Request &req) const {
  auto value = req.get_header_value("Authorization");
  if (value.empty()) {
    throw GatewayError(ErrorKind::auth, "Authorization header is missing");
  }

  auto space = value.find(' ');
  auto scheme = value.substr(0, space);
  auto token = space == std::string::npos ? "" : value.substr(space + 1);
  if (!boost::algorithm::iequals(scheme, "bearer") ||
      !equal_secret(token, config_.get_api_key())) {
    throw GatewayError(ErrorKind::auth, "Invalid API Key");
  }
}

void Api::handle(const httplib::Request &req, httplib::Response &res) {
  const auto &path = req.path;

  try {
    using handler_t = void (Api::*)(const httplib::Request &,
                                    httplib::Response &);
    struct Route {
      const char *method;
      handler_t handler;
      bool protect;
    };
    static const std::map<std::string, Route> routes{
        {"/", {"GET", &Api::health, false}},
        {"/v1/audio/transcriptions", {"POST", &Api::transcriptions, true}},
        {"/v1/audio/chunk", {"POST", &Api::chunk, true}},
        {"/v1/audio/merge", {"POST", &Api::merge, true}},
        {"/v1/audio/from_url", {"POST", &Api::from_url, true}},
    };

    auto route = routes.find(path);
    if (route == routes.end()) {
      throw GatewayError(ErrorKind::not_found, "Not Found");
    }
    if (req.method != route->second.method) {
      throw GatewayError(ErrorKind::method_not_allowed, "Method Not Allowed");
    }
    if (route->second.protect) {
      authorize(req);
    }

    BOOST_LOG_TRIVIAL(debug) << "api:: " << req.method << " " << path;
    (this->*route->second.handler)(req, res);

  } catch (const GatewayError &e) {
    if (http_status(e.kind()) >= 500) {
      BOOST_LOG_TRIVIAL(error) << "api:: " << path << " failed with "
                               << to_string(e.kind()) << ": " << e.what();
    } else {
      BOOST_LOG_TRIVIAL(warning) << "api:: " << path << " rejected with "
                                 << to_string(e.kind()) << ": " << e.what();
    }
    error_response(res, e.kind(), e.what());
  } catch (const std::exception &e) {
    BOOST_LOG_TRIVIAL(error) << "api:: " << path
                             << " failed with exception: " << e.what();
    error_response(res, ErrorKind::internal, "Internal server error");
  }
}

void Api::health(const httplib::Request &, httplib::Response &res) {
  json_response(res, json{{"status", "ok"},
                          {"message", "Welcome to the whisper-gateway API!"}});
}

void Api::transcriptions(const httplib::Request &req,
                         httplib::Response &res) {
  if (!req.is_multipart_form_data()) {
    throw invalid("Expected multipart/form-data");
  }
  if (!req.form.has_file("file")) {
    throw invalid("Field 'file' is required");
  }
  /* accepted for compatibility, the loaded model is always used */
  if (!req.form.has_field("model")) {
    throw invalid("Field 'model' is required");
  }
  auto format = response_format(form_field(req, "response_format"));
  auto prompt = form_field(req, "prompt");
  auto file = req.form.get_file("file");

  TempFile audio(upload_dir_ / (unique_token() + "_" +
                                sanitize_filename(file.filename, "audio")));
  {
    std::ofstream out(audio.path(), std::ios::binary | std::ios::trunc);
    out.write(file.content.data(), file.content.size());
    if (!out) {
      throw GatewayError(ErrorKind::internal,
                         "Cannot store upload " + audio.path().string());
    }
  }

  auto result = gateway_.transcribe(audio.path().string(), prompt);
  rendered_response(res, gateway_.render(result, format));
}

void Api::chunk(const httplib::Request &req, httplib::Response &res) {
  std::string content_key, index_value, total_value, filename;
  std::string_view bytes;
  std::string form_bytes;

  if (req.has_header("upload-file-md5")) {
    content_key = req.get_header_value("upload-file-md5");
    index_value = req.get_header_value("upload-chunk-index");
    total_value = req.get_header_value("upload-total-chunks");
    filename = req.get_header_value("upload-filename");
    bytes = req.body;
  } else if (req.is_multipart_form_data()) {
    content_key = req.form.get_field("fileMd5");
    index_value = req.form.get_field("chunkIndex");
    total_value = req.form.get_field("totalChunks");
    filename = req.form.get_field("filename");
    if (!req.form.has_file("file")) {
      throw invalid("Field 'file' is required");
    }
    auto file = req.form.get_file("file");
    if (filename.empty()) {
      filename = file.filename;
    }
    form_bytes = std::move(file.content);
    bytes = form_bytes;
  } else {
    throw invalid("Missing chunk upload headers");
  }

  if (content_key.empty()) {
    throw invalid("Missing file checksum");
  }
  if (index_value.empty()) {
    throw invalid("Missing chunk index");
  }
  auto index = parse_index(index_value);
  if (!index) {
    throw invalid("Invalid chunk index '" + index_value + "'");
  }
  auto total = parse_total(total_value);
  ChunkStore::validate_key(content_key);

  auto ack = assembler_.accept_chunk(content_key, *index, total,
                                     sanitize_filename(filename, ""), bytes);
  json_response(res, json{{"status", "ok"},
                          {"chunk_index", ack.chunk_index},
                          {"filename", ack.filename},
                          {"bytes", ack.bytes}});
}

void Api::merge(const httplib::Request &req, httplib::Response &res) {
  auto j = parse_json_body(req);
  auto content_key = optional_string(j, "fileMd5");
  if (!content_key || content_key->empty()) {
    throw invalid("Field 'fileMd5' is required");
  }
  auto filename = optional_string(j, "filename").value_or("");
  auto cleanup = optional_bool(j, "cleanup").value_or(true);
  auto total = optional_count(j, "totalChunks");
  auto prompt = optional_string(j, "prompt");
  ChunkStore::validate_key(*content_key);

  auto artifact = assembler_.merge(*content_key, filename, cleanup, total);
  auto result = gateway_.transcribe(artifact.get_path().string(), prompt);
  auto rendered = gateway_.render(result, ResponseFormat::verbose_json);
  if (!artifact.release()) {
    BOOST_LOG_TRIVIAL(warning) << "api:: upload " << *content_key
                               << " was transcribed, cleanup incomplete";
  }
  rendered_response(res, std::move(rendered));
}

void Api::from_url(const httplib::Request &req, httplib::Response &res) {
  auto j = parse_json_body(req);
  auto url = optional_string(j, "url");
  if (!url || url->empty()) {
    throw invalid("Field 'url' is required");
  }
  auto filename = optional_string(j, "filename").value_or("");
  auto format = response_format(optional_string(j, "response_format"));
  auto prompt = optional_string(j, "prompt");

  std::map<std::string, std::string> headers;
  auto it = j.find("headers");
  if (it != j.end() && !it->is_null()) {
    if (!it->is_object()) {
      throw invalid("'headers' must be an object");
    }
    for (const auto &header : it->items()) {
      if (!header.value().is_string()) {
        throw invalid("Header '" + header.key() + "' must be a string");
      }
      auto value = header.value().get<std::string>();
      if (header.key().find_first_of(":\r\n") != std::string::npos ||
          value.find_first_of("\r\n") != std::string::npos) {
        throw invalid("Header '" + header.key() + "' is malformed");
      }
      headers[header.key()] = value;
    }
  }

  auto audio = fetcher_.fetch(*url, headers, filename);
  auto result = gateway_.transcribe(audio.path().string(), prompt);
  rendered_response(res, gateway_.render(result, format));
}
