#pragma once

#include <cstddef>
#include <string>

#include "http/IHttpClient.hpp"
#include "ip/IIpResolver.hpp"

namespace ddns::ip {

/// Reads the public IP from a plain-text "what is my IP" endpoint.
/// The body is trimmed and returned as-is; it is not validated as an address.
/// Class abbreviation: hir
class HttpIpResolver : public IIpResolver {
 public:
  /// Only a short address string is expected back.
  static constexpr std::size_t kMaxBodyBytes = 64;

  HttpIpResolver(http::IHttpClient& hcClient, std::string sEndpoint);
  ~HttpIpResolver() override;

  /// Throws TransportError on network failure, ProviderError on a non-2xx
  /// status, an oversized body, or an empty body.
  std::string fetch() override;

 private:
  http::IHttpClient& _hcClient;
  std::string _sEndpoint;
};

}  // namespace ddns::ip
