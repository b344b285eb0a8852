#include "emitcore/util/url.h"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace emitcore::util {

static std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

static bool IsDefaultPort(const std::string& scheme, int port) {
  return (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
}

std::string Url::Origin() const {
  std::string out = scheme + "://" + host;
  if (port) {
    out += ":" + std::to_string(*port);
  }
  return out;
}

std::string Url::Href() const {
  return Origin() + path + query + fragment;
}

std::optional<Url> ParseUrl(std::string_view text) {
  // Leading / trailing whitespace is not part of the URL
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }

  // ----------------------------------------------------------
  // Scheme
  // ----------------------------------------------------------
  const auto scheme_end = text.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    return std::nullopt;
  }

  Url url;
  url.scheme = ToLower(text.substr(0, scheme_end));
  if (url.scheme != "http" && url.scheme != "https") {
    return std::nullopt;
  }

  std::string_view rest = text.substr(scheme_end + 3);

  // ----------------------------------------------------------
  // Authority
  // ----------------------------------------------------------
  const auto authority_end = rest.find_first_of("/?#");
  std::string_view authority = rest.substr(0, authority_end);
  rest = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

  // Userinfo is never valid for a collector endpoint
  if (authority.find('@') != std::string_view::npos) {
    return std::nullopt;
  }

  std::string_view host;
  std::string_view port;

  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    host = authority.substr(0, close + 1);
    std::string_view after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        return std::nullopt;
      }
      port = after.substr(1);
    }
  } else {
    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
      host = authority.substr(0, colon);
      port = authority.substr(colon + 1);
    } else {
      host = authority;
    }
  }

  if (host.empty() || host.find_first_of(" \t\\") != std::string_view::npos) {
    return std::nullopt;
  }
  url.host = ToLower(host);

  if (!port.empty()) {
    int value = 0;
    const auto* first = port.data();
    const auto* last = port.data() + port.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value < 0 || value > 65535) {
      return std::nullopt;
    }
    if (!IsDefaultPort(url.scheme, value)) {
      url.port = value;
    }
  }

  // ----------------------------------------------------------
  // Path / query / fragment
  // ----------------------------------------------------------
  const auto fragment_pos = rest.find('#');
  if (fragment_pos != std::string_view::npos) {
    url.fragment = std::string(rest.substr(fragment_pos));
    rest = rest.substr(0, fragment_pos);
  }

  const auto query_pos = rest.find('?');
  if (query_pos != std::string_view::npos) {
    url.query = std::string(rest.substr(query_pos));
    rest = rest.substr(0, query_pos);
  }

  url.path = rest.empty() ? "/" : std::string(rest);
  return url;
}

}  // namespace emitcore::util
