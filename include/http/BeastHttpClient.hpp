#pragma once

#include <chrono>
#include <string>

#include "http/IHttpClient.hpp"

namespace ddns::http {

/// Blocking HTTP/1.1 client over Boost.Beast. HTTPS uses OpenSSL with the
/// system trust store, SNI and host name verification.
/// Every connect, handshake, write and read is bounded by the timeout.
/// A fresh connection is opened per request.
/// Class abbreviation: bhc
class BeastHttpClient : public IHttpClient {
 public:
  explicit BeastHttpClient(std::chrono::seconds durTimeout);
  ~BeastHttpClient() override;

  HttpResponse send(const HttpRequest& hreqRequest) override;

 private:
  std::chrono::seconds _durTimeout;
};

}  // namespace ddns::http
