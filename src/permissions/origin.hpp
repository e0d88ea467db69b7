#pragma once

#include <string>
#include <string_view>

namespace dappvault::permissions {

// Canonical origin key: scheme://host[:port] with scheme and host lowercased,
// userinfo, path, query and fragment dropped, and default ports (80 for
// http/ws, 443 for https/wss) omitted. Input that does not look like a URL
// with an authority is returned unchanged.
std::string NormalizeOrigin(std::string_view url);

}  // namespace dappvault::permissions
