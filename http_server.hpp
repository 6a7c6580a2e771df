//
//  http_server.hpp
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

#ifndef _HTTP_SERVER_HPP_
#define _HTTP_SERVER_HPP_

#include <httplib.h>

#include <thread>

#include "api.hpp"
#include "config.hpp"

/*
 * Listener in front of Api. Requests are served on a pool of
 * get_threads() workers, so a long transcription only holds its own
 * connection. Reads time out per receive, not per request, so a slow
 * but steady upload is never cut off.
 */
class HttpServer {
public:
  HttpServer(const Config &config, Api &api) : config_(config), api_(api){};
  HttpServer(const HttpServer &) = delete;
  ~HttpServer() { stop(); }

  /* bind and start serving, false if the endpoint is unusable */
  bool start();
  void stop();

  /* bound port, differs from the configured one when that was 0 */
  int get_port() const { return port_; }

private:
  const Config &config_;
  Api &api_;
  httplib::Server svr_;
  std::thread listener_;
  int port_{0};
};

#endif
