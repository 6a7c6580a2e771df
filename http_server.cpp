//
//  http_server.cpp
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

#include "http_server.hpp"
#include "log.hpp"

static const std::string server_name("whisper-gateway");

bool HttpServer::start() {
  auto threads = static_cast<size_t>(config_.get_threads());
  svr_.new_task_queue = [threads] {
    return new httplib::ThreadPool(threads);
  };
  svr_.set_payload_max_length(config_.get_max_body_size());
  svr_.set_read_timeout(config_.get_read_timeout(), 0);
  svr_.set_default_headers({{"Server", server_name}});

  /* Api does its own routing so it can tell 404 from 405 */
  auto dispatch = [this](const httplib::Request &req, httplib::Response &res) {
    api_.handle(req, res);
  };
  svr_.Get(".*", dispatch);
  svr_.Post(".*", dispatch);
  svr_.Put(".*", dispatch);
  svr_.Patch(".*", dispatch);
  svr_.Delete(".*", dispatch);
  svr_.Options(".*", dispatch);

  /* failures detected by httplib itself, before Api saw the request */
  svr_.set_error_handler([](const httplib::Request &req,
                            httplib::Response &res) {
    if (!res.body.empty())
      return;
    if (res.status == 413) {
      BOOST_LOG_TRIVIAL(warning) << "http_server:: request body of "
                                 << req.path << " too large";
      Api::error_response(res, ErrorKind::payload_too_large,
                          "Request body too large");
    } else if (res.status >= 500) {
      Api::error_response(res, ErrorKind::internal, "Internal server error");
    } else {
      auto status = res.status;
      Api::error_response(res, ErrorKind::validation, "Malformed request");
      res.status = status;
    }
  });

  svr_.set_exception_handler([](const httplib::Request &req,
                                httplib::Response &res,
                                std::exception_ptr ep) {
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception &e) {
      BOOST_LOG_TRIVIAL(error) << "http_server:: " << req.path
                               << " failed with exception: " << e.what();
    }
    Api::error_response(res, ErrorKind::internal, "Internal server error");
  });

  if (config_.get_port() == 0) {
    port_ = svr_.bind_to_any_port(config_.get_host());
  } else if (svr_.bind_to_port(config_.get_host(), config_.get_port())) {
    port_ = config_.get_port();
  }
  if (port_ <= 0) {
    BOOST_LOG_TRIVIAL(error) << "http_server:: cannot bind to "
                             << config_.get_host() << ":"
                             << config_.get_port();
    return false;
  }

  listener_ = std::thread([this] {
    if (!svr_.listen_after_bind()) {
      BOOST_LOG_TRIVIAL(error) << "http_server:: listener stopped on error";
    }
  });
  svr_.wait_until_ready();

  BOOST_LOG_TRIVIAL(info) << "http_server:: listening on "
                          << config_.get_host() << ":" << port_ << " with "
                          << threads << " workers";
  return true;
}

void HttpServer::stop() {
  svr_.stop();
  if (listener_.joinable()) {
    BOOST_LOG_TRIVIAL(debug) << "http_server:: stopping";
    listener_.join();
  }
}
