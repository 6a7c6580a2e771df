//
//  api.hpp
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

#ifndef _API_HPP_
#define _API_HPP_

#include <filesystem>
#include <string>

#include <httplib.h>

#include "chunk_assembler.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "remote_fetcher.hpp"
#include "transcription_gateway.hpp"

/*
 * OpenAI compatible transcription API. handle() maps one request to
 * one response and never throws; all failures become JSON errors of
 * the form {"detail": "...", "error": {"kind": "..."}}.
 */
class Api {
public:
  Api(const Config &config, ChunkAssembler &assembler, RemoteFetcher &fetcher,
      TranscriptionGateway &gateway, const std::filesystem::path &upload_dir);
  Api(const Api &) = delete;

  void handle(const httplib::Request &req, httplib::Response &res);

  static void error_response(httplib::Response &res, ErrorKind kind,
                             const std::string &detail);

private:
  void authorize(const httplib::Request &req) const;

  void health(const httplib::Request &req, httplib::Response &res);
  void transcriptions(const httplib::Request &req, httplib::Response &res);
  void chunk(const httplib::Request &req, httplib::Response &res);
  void merge(const httplib::Request &req, httplib::Response &res);
  void from_url(const httplib::Request &req, httplib::Response &res);

  const Config &config_;
  ChunkAssembler &assembler_;
  RemoteFetcher &fetcher_;
  TranscriptionGateway &gateway_;
  std::filesystem::path upload_dir_;
};

#endif
