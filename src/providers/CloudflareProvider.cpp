#include "providers/CloudflareProvider.hpp"

#include "common/Errors.hpp"
#include "http/Url.hpp"

#include <utility>

namespace ddns::providers {

namespace {

/// Cloudflare reports failures as {"errors":[{"code":..,"message":..}]}.
std::string describeErrors(const http::HttpResponse& hres) {
  std::string sDetail = std::to_string(hres.iStatus) + " " + hres.sReason;
  auto jBody = nlohmann::json::parse(hres.sBody, nullptr, false);
  if (jBody.is_discarded() || !jBody.is_object()) {
    return sDetail;
  }
  auto it = jBody.find("errors");
  if (it == jBody.end() || !it->is_array()) {
    return sDetail;
  }
  for (const auto& jErr : *it) {
    if (jErr.is_object()) {
      sDetail += "; " + std::to_string(jErr.value("code", 0)) + ": " +
                 jErr.value("message", std::string{});
    }
  }
  return sDetail;
}

}  // namespace

CloudflareProvider::CloudflareProvider(http::IHttpClient& hcClient, std::string sApiEndpoint,
                                       std::string sToken)
    : _hcClient(hcClient), _sApiEndpoint(std::move(sApiEndpoint)), _sToken(std::move(sToken)) {
  while (!_sApiEndpoint.empty() && _sApiEndpoint.back() == '/') {
    _sApiEndpoint.pop_back();
  }
}

CloudflareProvider::~CloudflareProvider() = default;

std::string CloudflareProvider::name() const { return "cloudflare"; }

http::HttpResponse CloudflareProvider::call(const std::string& sMethod,
                                            const std::string& sPath,
                                            const std::string& sBody) {
  http::HttpRequest hreq;
  hreq.sMethod = sMethod;
  hreq.sUrl = _sApiEndpoint + sPath;
  hreq.vHeaders.emplace_back("Authorization", "Bearer " + _sToken);
  if (!sBody.empty()) {
    hreq.vHeaders.emplace_back("Content-Type", "application/json");
    hreq.sBody = sBody;
  }

  auto hres = _hcClient.send(hreq);
  if (!hres.ok()) {
    throw common::ProviderError("provider_rejected",
                                sMethod + " " + sPath + " failed: " + describeErrors(hres));
  }
  return hres;
}

nlohmann::json CloudflareProvider::decode(const http::HttpResponse& hres) {
  try {
    return nlohmann::json::parse(hres.sBody);
  } catch (const nlohmann::json::parse_error& ex) {
    throw common::ProviderError("invalid_response",
                                std::string("Undecodable provider response: ") + ex.what());
  }
}

std::optional<std::string> CloudflareProvider::firstResultId(const nlohmann::json& jBody) {
  try {
    const auto& jResult = jBody.at("result");
    if (!jResult.is_array()) {
      throw common::ProviderError("invalid_response", "Provider 'result' is not an array");
    }
    if (jResult.empty()) {
      return std::nullopt;
    }
    return jResult.front().at("id").get<std::string>();
  } catch (const nlohmann::json::exception& ex) {
    throw common::ProviderError("invalid_response",
                                std::string("Unexpected provider response: ") + ex.what());
  }
}

nlohmann::json CloudflareProvider::toJson(const common::RecordPayload& rpPayload) {
  return {
      {"type", rpPayload.sType},
      {"name", rpPayload.sName},
      {"content", rpPayload.sContent},
      {"ttl", rpPayload.iTtl},
      {"proxied", rpPayload.bProxied},
  };
}

std::string CloudflareProvider::resolveZoneId(const std::string& sZoneName) {
  auto hres = call("GET", "/zones?name=" + http::urlEncode(sZoneName), "");
  auto oId = firstResultId(decode(hres));
  if (!oId) {
    throw common::NotFoundError("zone_not_found", "zone \"" + sZoneName + "\" not found");
  }
  return *oId;
}

std::optional<std::string> CloudflareProvider::findRecordId(const std::string& sZoneId,
                                                            const std::string& sType,
                                                            const std::string& sFqdn) {
  auto hres = call("GET",
                   "/zones/" + sZoneId + "/dns_records?type=" + http::urlEncode(sType) +
                       "&name=" + http::urlEncode(sFqdn),
                   "");
  return firstResultId(decode(hres));
}

std::string CloudflareProvider::createRecord(const std::string& sZoneId,
                                             const common::RecordPayload& rpPayload) {
  auto hres = call("POST", "/zones/" + sZoneId + "/dns_records", toJson(rpPayload).dump());
  auto jBody = decode(hres);
  try {
    return jBody.at("result").at("id").get<std::string>();
  } catch (const nlohmann::json::exception& ex) {
    throw common::ProviderError("invalid_response",
                                std::string("Create response carries no record id: ") +
                                    ex.what());
  }
}

void CloudflareProvider::updateRecord(const std::string& sZoneId, const std::string& sRecordId,
                                      const common::RecordPayload& rpPayload) {
  call("PUT", "/zones/" + sZoneId + "/dns_records/" + sRecordId, toJson(rpPayload).dump());
}

}  // namespace ddns::providers
