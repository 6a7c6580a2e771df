//
//  upload_session.cpp
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

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "fs_utils.hpp"
#include "log.hpp"
#include "upload_session.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

const char *const UploadSession::file_name = "session.json";

std::optional<UploadSession> UploadSession::load(const fs::path &dir) {
  std::ifstream in(dir / file_name);
  if (!in) {
    return std::nullopt;
  }

  try {
    json j = json::parse(in);
    UploadSession session(j.at("content_key").get<std::string>());
    session.display_name_ = j.value("display_name", "");
    if (j.contains("expected_total") && !j["expected_total"].is_null()) {
      session.expected_total_ = j["expected_total"].get<uint64_t>();
    }
    return session;
  } catch (const json::exception &e) {
    throw GatewayError(ErrorKind::internal, "corrupt session record in " +
                                                dir.string() + ": " +
                                                e.what());
  }
}

void UploadSession::save(const fs::path &dir) const {
  json j;
  j["content_key"] = content_key_;
  j["display_name"] = display_name_;
  if (expected_total_) {
    j["expected_total"] = *expected_total_;
  } else {
    j["expected_total"] = nullptr;
  }
  write_file_atomic(dir / file_name, j.dump());
}

bool UploadSession::offer_display_name(const std::string &name) {
  if (name.empty() || !display_name_.empty())
    return false;
  display_name_ = name;
  return true;
}

bool UploadSession::declare_total(uint64_t total) {
  if (!expected_total_) {
    expected_total_ = total;
    return true;
  }
  if (*expected_total_ != total) {
    std::ostringstream os;
    os << "upload " << content_key_ << " was declared with " << *expected_total_
       << " chunks, got " << total;
    throw GatewayError(ErrorKind::inconsistent_total, os.str());
  }
  return false;
}
