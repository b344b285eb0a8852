#pragma once

#include <optional>
#include <string>
#include <string_view>

/*
 * Minimal http(s) URL parser.
 *
 * Purpose:
 *   - Validate collector endpoints from env vars and settings
 *   - Produce the origin (scheme://host[:port]) for gRPC
 *   - Produce the normalized full URL for HTTP
 *
 * Supported:
 *   - http and https schemes only
 *   - bracketed IPv6 hosts
 *   - optional port, path, query, fragment
 *
 * Normalization:
 *   - scheme and host are lowercased
 *   - default ports (80 / 443) are dropped
 *   - an empty path becomes "/"
 */

namespace emitcore::util {

struct Url {
  std::string scheme;
  std::string host;
  std::optional<int> port;
  std::string path;  // always starts with '/'
  std::string query;     // including leading '?', may be empty
  std::string fragment;  // including leading '#', may be empty

  std::string Origin() const;
  std::string Href() const;
};

std::optional<Url> ParseUrl(std::string_view text);

}  // namespace emitcore::util
