#pragma once

#include <string>

#include "tnsw/config.h"

namespace tnsw {

int set_log_level(config const&);

int set_log_level(std::string&& log_lvl);

}  // namespace tnsw
