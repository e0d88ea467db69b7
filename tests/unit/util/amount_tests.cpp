#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "util/amount.hpp"

using dappvault::util::CreditsFromDouble;
using dappvault::util::FormatCredits;
using dappvault::util::ParseCredits;

int main() {
  struct Case {
    const char* text;
    bool ok;
    std::int64_t expected;
  };
  const Case cases[] = {
      {"10", true, 10000000},      {"0.1", true, 100000},  {"2.000001", true, 2000001},
      {"0", true, 0},              {"1.", false, 0},       {".5", true, 500000},
      {"0.0000001", false, 0},     {"-1", false, 0},       {"1e3", false, 0},
      {"", false, 0},              {"12abc", false, 0},
  };
  for (const auto& c : cases) {
    std::int64_t value = -1;
    const bool ok = ParseCredits(c.text, &value);
    if (ok != c.ok || (ok && value != c.expected)) {
      std::cerr << "amount_tests: ParseCredits(\"" << c.text << "\") gave ok=" << ok
                << " value=" << value << "\n";
      return EXIT_FAILURE;
    }
  }

  std::int64_t micro = 0;
  if (!CreditsFromDouble(0.1, &micro) || micro != 100000) {
    std::cerr << "amount_tests: 0.1 credits should be 100000 microcredits, got " << micro << "\n";
    return EXIT_FAILURE;
  }
  if (CreditsFromDouble(-0.5, &micro)) {
    std::cerr << "amount_tests: negative amounts must be rejected\n";
    return EXIT_FAILURE;
  }

  if (FormatCredits(10000000) != "10" || FormatCredits(100000) != "0.1" ||
      FormatCredits(2000001) != "2.000001" || FormatCredits(0) != "0") {
    std::cerr << "amount_tests: unexpected FormatCredits output\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
