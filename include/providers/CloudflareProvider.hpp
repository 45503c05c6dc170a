#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "http/IHttpClient.hpp"
#include "providers/IDnsProvider.hpp"

namespace ddns::providers {

/// Cloudflare API v4 provider implementation.
/// Class abbreviation: cf
class CloudflareProvider : public IDnsProvider {
 public:
  CloudflareProvider(http::IHttpClient& hcClient, std::string sApiEndpoint,
                     std::string sToken);
  ~CloudflareProvider() override;

  std::string name() const override;
  std::string resolveZoneId(const std::string& sZoneName) override;
  std::optional<std::string> findRecordId(const std::string& sZoneId,
                                          const std::string& sType,
                                          const std::string& sFqdn) override;
  std::string createRecord(const std::string& sZoneId,
                           const common::RecordPayload& rpPayload) override;
  void updateRecord(const std::string& sZoneId, const std::string& sRecordId,
                    const common::RecordPayload& rpPayload) override;

 private:
  /// Send an authenticated request; throws ProviderError on non-2xx.
  http::HttpResponse call(const std::string& sMethod, const std::string& sPath,
                          const std::string& sBody);

  /// Parse a response body; throws ProviderError if it is not JSON.
  static nlohmann::json decode(const http::HttpResponse& hres);

  /// First "id" of the "result" array, or std::nullopt if it is empty.
  static std::optional<std::string> firstResultId(const nlohmann::json& jBody);

  static nlohmann::json toJson(const common::RecordPayload& rpPayload);

  http::IHttpClient& _hcClient;
  std::string _sApiEndpoint;
  std::string _sToken;
};

}  // namespace ddns::providers
