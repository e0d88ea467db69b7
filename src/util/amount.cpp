#include "util/amount.hpp"

#include <cmath>
#include <limits>

namespace dappvault::util {

bool ParseCredits(std::string_view text, std::int64_t* microcredits) {
  if (!microcredits || text.empty()) {
    return false;
  }
  const auto dot = text.find('.');
  const auto whole = text.substr(0, dot);
  const auto frac = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);
  if ((whole.empty() && frac.empty()) || frac.size() > 6 ||
      (dot != std::string_view::npos && frac.empty())) {
    return false;
  }
  constexpr std::int64_t kMaxWhole =
      std::numeric_limits<std::int64_t>::max() / kMicrocreditsPerCredit - 1;
  std::int64_t value = 0;
  for (char c : whole) {
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + (c - '0');
    if (value > kMaxWhole) {
      return false;
    }
  }
  std::int64_t fraction = 0;
  std::int64_t scale = kMicrocreditsPerCredit;
  for (char c : frac) {
    if (c < '0' || c > '9') {
      return false;
    }
    scale /= 10;
    fraction += (c - '0') * scale;
  }
  *microcredits = value * kMicrocreditsPerCredit + fraction;
  return true;
}

bool CreditsFromDouble(double credits, std::int64_t* microcredits) {
  if (!microcredits || !std::isfinite(credits) || credits < 0.0) {
    return false;
  }
  const double scaled = credits * static_cast<double>(kMicrocreditsPerCredit);
  if (scaled >= 9.0e18) {
    return false;
  }
  *microcredits = static_cast<std::int64_t>(std::llround(scaled));
  return true;
}

std::string FormatCredits(std::int64_t microcredits) {
  const bool negative = microcredits < 0;
  const std::uint64_t magnitude = negative ? static_cast<std::uint64_t>(-(microcredits + 1)) + 1
                                           : static_cast<std::uint64_t>(microcredits);
  std::string out = (negative ? "-" : "") + std::to_string(magnitude / kMicrocreditsPerCredit);
  std::uint64_t frac = magnitude % kMicrocreditsPerCredit;
  if (frac != 0) {
    std::string digits = std::to_string(frac);
    digits.insert(0, 6 - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') {
      digits.pop_back();
    }
    out += "." + digits;
  }
  return out;
}

double CreditsToDouble(std::int64_t microcredits) {
  return static_cast<double>(microcredits) / static_cast<double>(kMicrocreditsPerCredit);
}

}  // namespace dappvault::util
