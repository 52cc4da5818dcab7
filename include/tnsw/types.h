#pragma once

#include <map>
#include <string>

namespace tnsw {

using headers_t = std::map<std::string, std::string>;

}  // namespace tnsw
