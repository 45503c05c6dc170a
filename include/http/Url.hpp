#pragma once

#include <string>

namespace ddns::http {

/// Split form of an absolute http(s) URL.
/// Class abbreviation: url
struct Url {
  std::string sScheme;   // "http" or "https"
  std::string sHost;
  std::string sPort;     // defaults from the scheme when absent
  std::string sTarget;   // path plus query, at least "/"

  /// Parse "scheme://host[:port][/path][?query]".
  /// Throws ValidationError on an unsupported scheme or empty host.
  static Url parse(const std::string& sUrl);
};

/// Percent-encode a query parameter value (RFC 3986 unreserved set kept).
std::string urlEncode(const std::string& sValue);

}  // namespace ddns::http
