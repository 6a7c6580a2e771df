//
//  log.cpp
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

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/syslog_backend.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iostream>

#include "config.hpp"
#include "log.hpp"

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;
namespace keywords = boost::log::keywords;

using sink_t = sinks::synchronous_sink<sinks::syslog_backend>;

static void add_syslog_sink(boost::shared_ptr<logging::core> core) {
  boost::shared_ptr<sink_t> sink(
      new sink_t(keywords::facility = sinks::syslog::daemon,
                 keywords::use_impl = sinks::syslog::native));
  sink->set_formatter(expr::stream << "whisper-gateway: " << expr::smessage);

  sinks::syslog::custom_severity_mapping<logging::trivial::severity_level>
      mapping("Severity");
  mapping[logging::trivial::trace] = sinks::syslog::debug;
  mapping[logging::trivial::debug] = sinks::syslog::debug;
  mapping[logging::trivial::info] = sinks::syslog::info;
  mapping[logging::trivial::warning] = sinks::syslog::warning;
  mapping[logging::trivial::error] = sinks::syslog::error;
  mapping[logging::trivial::fatal] = sinks::syslog::critical;
  sink->locked_backend()->set_severity_mapper(mapping);

  core->add_sink(sink);
}

void log_init(const Config &config) {
  boost::shared_ptr<logging::core> core = logging::core::get();
  // remove all sink in case of re-configuration
  core->remove_all_sinks();

  if (config.get_syslog()) {
    add_syslog_sink(core);
  } else {
    logging::add_common_attributes();
    logging::add_console_log(
        std::clog,
        keywords::format =
            (expr::stream << expr::format_date_time<boost::posix_time::ptime>(
                                 "TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                          << " <" << logging::trivial::severity << "> "
                          << expr::smessage));
  }
  // set log level
  core->set_filter(logging::trivial::severity >= config.get_log_severity());
}
