#pragma once

#include <cinttypes>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace tnsw {

// Exact base-10 fixed point number: value = units_ / 10^scale_.
struct decimal {
  static constexpr auto const kMaxScale = 18U;

  static std::optional<decimal> parse(std::string_view);
  static std::optional<decimal> from_double(double);

  std::string to_string(unsigned min_fraction_digits = 0U) const;

  friend bool operator==(decimal const&, decimal const&);
  friend std::ostream& operator<<(std::ostream&, decimal const&);

  std::int64_t units_{0};
  std::uint8_t scale_{0U};
};

}  // namespace tnsw
