#include "ip/HttpIpResolver.hpp"

#include "common/Errors.hpp"

#include <cctype>
#include <utility>

namespace ddns::ip {

namespace {

std::string trim(const std::string& s) {
  std::size_t nStart = 0;
  std::size_t nEnd = s.size();
  while (nStart < nEnd && std::isspace(static_cast<unsigned char>(s[nStart]))) {
    ++nStart;
  }
  while (nEnd > nStart && std::isspace(static_cast<unsigned char>(s[nEnd - 1]))) {
    --nEnd;
  }
  return s.substr(nStart, nEnd - nStart);
}

}  // namespace

HttpIpResolver::HttpIpResolver(http::IHttpClient& hcClient, std::string sEndpoint)
    : _hcClient(hcClient), _sEndpoint(std::move(sEndpoint)) {}

HttpIpResolver::~HttpIpResolver() = default;

std::string HttpIpResolver::fetch() {
  http::HttpRequest hreq;
  hreq.sMethod = "GET";
  hreq.sUrl = _sEndpoint;
  hreq.uMaxBodyBytes = kMaxBodyBytes;

  const auto hres = _hcClient.send(hreq);
  if (!hres.ok()) {
    throw common::ProviderError("ip_lookup_rejected",
                                "IP provider returned " + std::to_string(hres.iStatus) + " " +
                                    hres.sReason);
  }
  if (hres.sBody.size() > kMaxBodyBytes) {
    throw common::ProviderError("response_too_large",
                                "IP provider response exceeds " +
                                    std::to_string(kMaxBodyBytes) + " bytes");
  }

  std::string sIp = trim(hres.sBody);
  if (sIp.empty()) {
    throw common::ProviderError("ip_lookup_empty", "IP provider returned an empty body");
  }
  return sIp;
}

}  // namespace ddns::ip
