#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "fmt/format.h"

namespace tnsw {

struct error : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Invalid or contradicting request parameters. Raised before any network
// request is issued.
struct configuration_error : public error {
  template <typename... Args>
  explicit configuration_error(fmt::format_string<Args...> fmt_str,
                               Args&&... args)
      : error{fmt::format(fmt_str, std::forward<Args>(args)...)} {}
};

// Non-success HTTP status, transport failure or timeout.
// status() is 0 if no response was received at all.
struct upstream_error : public error {
  template <typename... Args>
  upstream_error(unsigned const status,
                 fmt::format_string<Args...> fmt_str,
                 Args&&... args)
      : error{fmt::format(fmt_str, std::forward<Args>(args)...)},
        status_{status} {}

  unsigned status() const noexcept { return status_; }

private:
  unsigned status_;
};

// Response body does not match the expected schema.
struct malformed_response : public error {
  template <typename... Args>
  explicit malformed_response(fmt::format_string<Args...> fmt_str,
                              Args&&... args)
      : error{fmt::format(fmt_str, std::forward<Args>(args)...)} {}
};

}  // namespace tnsw
