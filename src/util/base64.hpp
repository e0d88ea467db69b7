#pragma once

#include <string>
#include <string_view>

namespace dappvault::util {

// Standard alphabet with '=' padding, as used by HTTP basic authentication.
std::string Base64Encode(std::string_view input);

}  // namespace dappvault::util
