//
//  errors.cpp
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

#include "errors.hpp"

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::validation:
    return "validation_error";
  case ErrorKind::auth:
    return "auth_error";
  case ErrorKind::invalid_key:
    return "invalid_key";
  case ErrorKind::session_not_found:
    return "session_not_found";
  case ErrorKind::no_chunks:
    return "no_chunks";
  case ErrorKind::incomplete_upload:
    return "incomplete_upload";
  case ErrorKind::inconsistent_total:
    return "inconsistent_total";
  case ErrorKind::recognition_failure:
    return "recognition_failure";
  case ErrorKind::recognition_timeout:
    return "recognition_timeout";
  case ErrorKind::fetch_error:
    return "fetch_error";
  case ErrorKind::cleanup_partial:
    return "cleanup_partial";
  case ErrorKind::not_found:
    return "not_found";
  case ErrorKind::method_not_allowed:
    return "method_not_allowed";
  case ErrorKind::payload_too_large:
    return "payload_too_large";
  case ErrorKind::internal:
    break;
  }
  return "internal_error";
}

unsigned http_status(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::validation:
  case ErrorKind::invalid_key:
  case ErrorKind::session_not_found:
  case ErrorKind::no_chunks:
  case ErrorKind::incomplete_upload:
  case ErrorKind::inconsistent_total:
    return 400;
  case ErrorKind::auth:
    return 401;
  case ErrorKind::not_found:
    return 404;
  case ErrorKind::method_not_allowed:
    return 405;
  case ErrorKind::payload_too_large:
    return 413;
  case ErrorKind::recognition_timeout:
    return 504;
  case ErrorKind::recognition_failure:
  case ErrorKind::fetch_error:
  case ErrorKind::cleanup_partial:
  case ErrorKind::internal:
    break;
  }
  return 500;
}
