//
//  remote_fetcher.hpp
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

#ifndef _REMOTE_FETCHER_HPP_
#define _REMOTE_FETCHER_HPP_

#include <chrono>
#include <filesystem>
#include <map>
#include <string>

#include "fs_utils.hpp"

class RemoteFetcher {
public:
  static const std::string default_filename;

  /* a zero timeout lets a transfer run as long as data keeps coming */
  RemoteFetcher(const std::filesystem::path &download_dir,
                std::chrono::seconds timeout, bool allow_file_scheme = false);
  RemoteFetcher(const RemoteFetcher &) = delete;
  ~RemoteFetcher();

  /* hint if usable, else the last URL path segment, else the default */
  static std::string infer_filename(const std::string &url,
                                    const std::string &hint);

  /*
   * Stream url to a local temporary file. No retries.
   * Throws GatewayError(validation) for an unsupported URL and
   * GatewayError(fetch_error) for any transfer failure.
   */
  TempFile fetch(const std::string &url,
                 const std::map<std::string, std::string> &headers,
                 const std::string &filename_hint);

private:
  std::filesystem::path download_dir_;
  std::chrono::seconds timeout_;
  bool allow_file_scheme_{false};
  bool curl_global_acquired_{false};
};

#endif
