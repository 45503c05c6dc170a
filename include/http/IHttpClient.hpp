#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace ddns::http {

/// Class abbreviation: hreq
struct HttpRequest {
  std::string sMethod = "GET";
  std::string sUrl;
  std::vector<std::pair<std::string, std::string>> vHeaders;
  std::string sBody;
  std::size_t uMaxBodyBytes = 0;  // 0 = transport default
};

/// Class abbreviation: hres
struct HttpResponse {
  int iStatus = 0;
  std::string sReason;
  std::string sBody;

  bool ok() const { return iStatus >= 200 && iStatus < 300; }
};

/// Pure abstract interface for a blocking HTTP exchange.
/// Implementations throw common::TransportError when no response could be
/// obtained. Any HTTP status is returned to the caller.
class IHttpClient {
 public:
  virtual ~IHttpClient() = default;

  virtual HttpResponse send(const HttpRequest& hreqRequest) = 0;
};

}  // namespace ddns::http
