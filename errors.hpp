//
//  errors.hpp
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

#ifndef _ERRORS_HPP_
#define _ERRORS_HPP_

#include <stdexcept>
#include <string>

enum class ErrorKind {
  validation,
  auth,
  invalid_key,
  session_not_found,
  no_chunks,
  incomplete_upload,
  inconsistent_total,
  recognition_failure,
  recognition_timeout,
  fetch_error,
  cleanup_partial,
  not_found,
  method_not_allowed,
  payload_too_large,
  internal
};

/* stable identifier exposed to clients as error.kind */
const char *to_string(ErrorKind kind);

/* HTTP status code a failure of this kind is reported with */
unsigned http_status(ErrorKind kind);

class GatewayError : public std::runtime_error {
public:
  GatewayError(ErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

#endif
