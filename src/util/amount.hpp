#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace dappvault::util {

// Amounts are carried as integer microcredits everywhere below the command
// channel.
constexpr std::int64_t kMicrocreditsPerCredit = 1'000'000;

// Parses a non-negative decimal credit amount with at most six fractional
// digits ("10", "0.1", "2.000001").
bool ParseCredits(std::string_view text, std::int64_t* microcredits);

// Converts a JSON-style floating credit value, rounding to the nearest
// microcredit. Rejects negative, non-finite and out-of-range values.
bool CreditsFromDouble(double credits, std::int64_t* microcredits);

// Renders microcredits as a decimal credit string without trailing zeros
// ("10", "0.1").
std::string FormatCredits(std::int64_t microcredits);

double CreditsToDouble(std::int64_t microcredits);

}  // namespace dappvault::util
