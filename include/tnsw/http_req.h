#pragma once

#include <chrono>
#include <string>

#include "boost/url/url.hpp"

#include "tnsw/types.h"

namespace tnsw {

constexpr auto const kBodySizeLimit = 128U * 1024U * 1024U;  // 128 M

struct http_result {
  unsigned status_{0U};
  std::string body_;
};

// Blocking GET on a private io_context. Follows up to three redirects
// (relative locations are resolved against the request URL) and inflates
// gzip bodies. The timeout covers the whole request (resolve, connect,
// TLS handshake, redirects, body).
// Throws upstream_error (status 0) on transport failure and timeout.
http_result http_GET_sync(boost::urls::url const&,
                          headers_t const& headers,
                          std::chrono::seconds timeout);

}  // namespace tnsw
