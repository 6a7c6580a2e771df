//
//  remote_fetcher.cpp
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
#include <curl/curl.h>

#include <cctype>
#include <fstream>
#include <memory>
#include <mutex>

#include "errors.hpp"
#include "log.hpp"
#include "remote_fetcher.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

const std::string RemoteFetcher::default_filename("remote_audio");

static std::mutex curl_mutex;
static int curl_refcount = 0;

static bool acquire_curl_global() {
  std::lock_guard<std::mutex> lock(curl_mutex);
  if (curl_refcount == 0) {
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
      BOOST_LOG_TRIVIAL(error) << "remote_fetcher:: curl_global_init failed: "
                               << curl_easy_strerror(res);
      return false;
    }
  }
  ++curl_refcount;
  return true;
}

static void release_curl_global() {
  std::lock_guard<std::mutex> lock(curl_mutex);
  if (curl_refcount > 0 && --curl_refcount == 0) {
    curl_global_cleanup();
  }
}

static size_t write_callback(char *ptr, size_t size, size_t nmemb,
                             void *userdata) {
  auto out = static_cast<std::ofstream *>(userdata);
  out->write(ptr, size * nmemb);
  /* a short count makes curl abort with CURLE_WRITE_ERROR */
  return *out ? size * nmemb : 0;
}

static std::string percent_decode(const std::string &in) {
  std::string out;
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '%' && i + 2 < in.size() &&
        std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
      out.push_back(
          static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(in[i]);
    }
  }
  return out;
}

static std::string url_scheme(const std::string &url) {
  auto pos = url.find("://");
  if (pos == std::string::npos)
    return "";
  return boost::algorithm::to_lower_copy(url.substr(0, pos));
}

RemoteFetcher::RemoteFetcher(const fs::path &download_dir,
                             std::chrono::seconds timeout,
                             bool allow_file_scheme)
    : download_dir_(download_dir), timeout_(timeout),
      allow_file_scheme_(allow_file_scheme) {
  fs::create_directories(download_dir_);
  curl_global_acquired_ = acquire_curl_global();
  if (!curl_global_acquired_) {
    throw std::runtime_error("remote_fetcher:: cannot initialize libcurl");
  }
}

RemoteFetcher::~RemoteFetcher() {
  if (curl_global_acquired_) {
    release_curl_global();
  }
}

std::string RemoteFetcher::infer_filename(const std::string &url,
                                          const std::string &hint) {
  if (!hint.empty()) {
    return sanitize_filename(hint, default_filename);
  }

  std::string path = url;
  auto pos = path.find("://");
  if (pos != std::string::npos) {
    /* drop scheme and authority */
    auto slash = path.find('/', pos + 3);
    path = slash == std::string::npos ? "" : path.substr(slash);
  }
  pos = path.find_first_of("?#");
  if (pos != std::string::npos) {
    path.erase(pos);
  }
  pos = path.find_last_of('/');
  auto name = pos == std::string::npos ? path : path.substr(pos + 1);
  return sanitize_filename(percent_decode(name), default_filename);
}

TempFile RemoteFetcher::fetch(const std::string &url,
                              const std::map<std::string, std::string> &headers,
                              const std::string &filename_hint) {
  auto scheme = url_scheme(url);
  if (scheme != "http" && scheme != "https" &&
      !(allow_file_scheme_ && scheme == "file")) {
    throw GatewayError(ErrorKind::validation,
                       "Unsupported URL scheme in '" + url + "'");
  }

  TimeElapsed te("remote_fetcher:: download of " + url);
  TempFile file(download_dir_ /
                (unique_token() + "_" + infer_filename(url, filename_hint)));

  std::ofstream out(file.path(), std::ios::binary | std::ios::trunc);
  if (!out) {
    throw GatewayError(ErrorKind::fetch_error,
                       "Cannot create " + file.path().string());
  }

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                           curl_easy_cleanup);
  if (!curl) {
    throw GatewayError(ErrorKind::fetch_error, "curl_easy_init failed");
  }

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(
      nullptr, curl_slist_free_all);
  for (const auto &header : headers) {
    auto line = header.first + ": " + header.second;
    auto list = curl_slist_append(header_list.get(), line.c_str());
    if (list == nullptr) {
      throw GatewayError(ErrorKind::fetch_error, "curl_slist_append failed");
    }
    header_list.release();
    header_list.reset(list);
  }

  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT,
                   static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "whisper-gateway/1.0");
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out);

  CURLcode res = curl_easy_perform(curl.get());
  out.close();

  if (res != CURLE_OK) {
    std::string cause = errbuf[0] ? errbuf : curl_easy_strerror(res);
    BOOST_LOG_TRIVIAL(error) << "remote_fetcher:: " << url << ": " << cause;
    throw GatewayError(ErrorKind::fetch_error,
                       "Failed to download audio from URL: " + cause);
  }
  if (out.fail()) {
    throw GatewayError(ErrorKind::fetch_error,
                       "Cannot write " + file.path().string());
  }

  std::error_code ec;
  BOOST_LOG_TRIVIAL(info) << "remote_fetcher:: saved " << url << " to "
                          << file.path() << " ("
                          << fs::file_size(file.path(), ec) << " bytes)";
  return file;
}
