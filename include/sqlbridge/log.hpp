// Copyright (c) 2024 liudegui. MIT License.
//
// sqlbridge logging -- the library's spdlog logger.
//
// The logger is named "sqlbridge". An application that registers its own
// logger under that name before first use gets its sinks and level;
// otherwise a stderr colour logger is created.

#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace sqlbridge {

inline spdlog::logger& Log() {
  static std::shared_ptr<spdlog::logger> logger = [] {
    std::shared_ptr<spdlog::logger> l = spdlog::get("sqlbridge");
    if (l == nullptr) { l = spdlog::stderr_color_mt("sqlbridge"); }
    return l;
  }();
  return *logger;
}

}  // namespace sqlbridge
