#include "permissions/origin.hpp"

#include <cctype>

namespace dappvault::permissions {

namespace {

std::string Lower(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

bool IsDefaultPort(std::string_view scheme, std::string_view port) {
  if (scheme == "http" || scheme == "ws") return port == "80";
  if (scheme == "https" || scheme == "wss") return port == "443";
  return false;
}

bool ValidScheme(std::string_view scheme) {
  if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
    return false;
  }
  for (char c : scheme) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string NormalizeOrigin(std::string_view url) {
  const auto sep = url.find("://");
  if (sep == std::string_view::npos || !ValidScheme(url.substr(0, sep))) {
    return std::string(url);
  }
  const std::string scheme = Lower(url.substr(0, sep));
  auto authority = url.substr(sep + 3);
  authority = authority.substr(0, authority.find_first_of("/?#"));
  if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority.remove_prefix(at + 1);
  }

  std::string_view host = authority;
  std::string_view port;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return std::string(url);
    }
    host = authority.substr(0, close + 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        return std::string(url);
      }
      port = authority.substr(close + 2);
    }
  } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
    host = authority.substr(0, colon);
    port = authority.substr(colon + 1);
  }
  if (host.empty()) {
    return std::string(url);
  }
  for (char c : port) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::string(url);
    }
  }

  std::string origin = scheme + "://" + Lower(host);
  if (!port.empty() && !IsDefaultPort(scheme, port)) {
    origin += ":";
    origin += port;
  }
  return origin;
}

}  // namespace dappvault::permissions
