#include "tnsw/decimal.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <ostream>
#include <system_error>

namespace tnsw {

namespace {

decimal normalized(decimal d) {
  while (d.scale_ != 0U && d.units_ % 10 == 0) {
    d.units_ /= 10;
    --d.scale_;
  }
  return d;
}

}  // namespace

std::optional<decimal> decimal::parse(std::string_view s) {
  auto negative = false;
  if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
    negative = s.front() == '-';
    s.remove_prefix(1U);
  }
  if (s.empty()) {
    return std::nullopt;
  }

  auto units = std::uint64_t{0U};
  auto scale = 0U;
  auto n_digits = 0U;
  auto seen_dot = false;
  for (auto const c : s) {
    if (c == '.') {
      if (seen_dot) {
        return std::nullopt;
      }
      seen_dot = true;
      continue;
    }
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    if (units == 0U && c == '0' && !seen_dot) {
      continue;  // leading zero
    }
    if (++n_digits > 18U) {
      return std::nullopt;
    }
    units = units * 10U + static_cast<std::uint64_t>(c - '0');
    if (seen_dot) {
      ++scale;
    }
  }

  if (s.front() == '.' || s.back() == '.' || scale > kMaxScale) {
    return std::nullopt;
  }

  auto const value = static_cast<std::int64_t>(units);
  return decimal{.units_ = negative ? -value : value,
                 .scale_ = static_cast<std::uint8_t>(scale)};
}

std::optional<decimal> decimal::from_double(double const d) {
  // shortest representation that reads back as the same double
  auto buf = std::array<char, 64U>{};
  auto const [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d,
                                       std::chars_format::fixed);
  if (ec != std::errc{}) {
    return std::nullopt;
  }
  return parse(std::string_view{buf.data(), end});
}

std::string decimal::to_string(unsigned const min_fraction_digits) const {
  auto const scale = std::max(static_cast<unsigned>(scale_),
                              std::min(min_fraction_digits, kMaxScale));
  auto const negative = units_ < 0;

  // unsigned negation: well-defined for the minimum value
  auto const magnitude = static_cast<std::uint64_t>(units_);
  auto digits = std::to_string(negative ? std::uint64_t{0U} - magnitude
                                        : magnitude);
  digits.append(scale - scale_, '0');
  if (digits.size() <= scale) {
    digits.insert(0U, scale - digits.size() + 1U, '0');
  }
  if (scale != 0U) {
    digits.insert(digits.size() - scale, 1U, '.');
  }
  return negative ? "-" + digits : digits;
}

bool operator==(decimal const& a, decimal const& b) {
  auto const x = normalized(a);
  auto const y = normalized(b);
  return x.units_ == y.units_ && x.scale_ == y.scale_;
}

std::ostream& operator<<(std::ostream& out, decimal const& d) {
  return out << d.to_string();
}

}  // namespace tnsw
