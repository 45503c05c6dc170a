#include "http/Url.hpp"

#include "common/Errors.hpp"

#include <cctype>
#include <cstdio>

namespace ddns::http {

Url Url::parse(const std::string& sUrl) {
  Url url;

  const auto nSchemeEnd = sUrl.find("://");
  if (nSchemeEnd == std::string::npos) {
    throw common::ValidationError("invalid_url", "URL has no scheme: " + sUrl);
  }
  url.sScheme = sUrl.substr(0, nSchemeEnd);
  for (auto& c : url.sScheme) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (url.sScheme != "http" && url.sScheme != "https") {
    throw common::ValidationError("invalid_url", "Unsupported URL scheme: " + url.sScheme);
  }

  const auto nAuthorityStart = nSchemeEnd + 3;
  auto nTargetStart = sUrl.find_first_of("/?", nAuthorityStart);
  const std::string sAuthority = sUrl.substr(
      nAuthorityStart,
      nTargetStart == std::string::npos ? std::string::npos : nTargetStart - nAuthorityStart);

  // A bracketed IPv6 literal keeps its colons; only one after ']' starts a port.
  const auto nBracket = sAuthority.rfind(']');
  auto nColon = sAuthority.rfind(':');
  if (nBracket != std::string::npos && nColon != std::string::npos && nColon < nBracket) {
    nColon = std::string::npos;
  }
  if (nColon != std::string::npos) {
    url.sHost = sAuthority.substr(0, nColon);
    url.sPort = sAuthority.substr(nColon + 1);
  } else {
    url.sHost = sAuthority;
  }
  if (url.sHost.empty()) {
    throw common::ValidationError("invalid_url", "URL has no host: " + sUrl);
  }
  if (url.sPort.empty()) {
    url.sPort = url.sScheme == "https" ? "443" : "80";
  }

  if (nTargetStart == std::string::npos) {
    url.sTarget = "/";
  } else {
    url.sTarget = sUrl.substr(nTargetStart);
    if (url.sTarget.front() == '?') {
      url.sTarget.insert(url.sTarget.begin(), '/');
    }
  }
  return url;
}

std::string urlEncode(const std::string& sValue) {
  std::string sOut;
  sOut.reserve(sValue.size());
  for (unsigned char c : sValue) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      sOut += static_cast<char>(c);
    } else {
      char aBuf[4];
      std::snprintf(aBuf, sizeof(aBuf), "%%%02X", c);
      sOut += aBuf;
    }
  }
  return sOut;
}

}  // namespace ddns::http
