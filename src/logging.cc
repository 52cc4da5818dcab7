#include "tnsw/logging.h"

#include <algorithm>
#include <iostream>
#include <string_view>

#include "fmt/ostream.h"

#include "utl/logging.h"

namespace tnsw {

namespace {

int set_log_level(std::string_view log_lvl) {
  if (log_lvl == "error") {
    utl::log_verbosity = utl::log_level::error;
  } else if (log_lvl == "info") {
    utl::log_verbosity = utl::log_level::info;
  } else if (log_lvl == "debug") {
    utl::log_verbosity = utl::log_level::debug;
  } else {
    fmt::println(std::cerr, "Unsupported log level '{}'", log_lvl);
    return 1;
  }
  return 0;
}

}  // namespace

int set_log_level(config const& c) {
  if (c.logging_ && c.logging_->log_level_) {
    return set_log_level(std::string{*c.logging_->log_level_});
  }
  return 0;
}

int set_log_level(std::string&& log_lvl) {
  // accept "DEBUG" etc. from the command line
  std::transform(log_lvl.begin(), log_lvl.end(), log_lvl.begin(),
                 [](unsigned char const c) { return std::tolower(c); });
  return set_log_level(std::string_view{log_lvl});
}

}  // namespace tnsw
