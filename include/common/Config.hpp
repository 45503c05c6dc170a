#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace ddns::common {

/// JSON config file loader with environment overrides.
/// Loads the file into a typed struct and validates it before any network
/// activity takes place.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sApiToken;     // raw token (zeroed after handoff to the provider)
  std::string sIpProvider;   // host[/path], or a full URL with scheme
  std::vector<ZoneSpec> vZones;

  // ── Polling ───────────────────────────────────────────────────────────
  int iPollIntervalSeconds = 300;

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iRequestTimeoutSeconds = 30;
  std::string sApiBaseUrl = "https://api.cloudflare.com/client/v4";

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate config from the JSON file at sPath.
  /// DDNS_CLOUDFLARE_API_TOKEN (or its _FILE variant), DDNS_IP_PROVIDER,
  /// DDNS_POLL_INTERVAL and DDNS_LOG_LEVEL override the file when set.
  /// Throws ValidationError on unreadable files, malformed JSON, or any
  /// violated constraint.
  static Config load(const std::string& sPath);

  /// URL the IP resolver should GET. Prefixes "https://" unless the
  /// configured provider already names a scheme.
  std::string ipLookupUrl() const;

 private:
  /// Read an env var with optional _FILE fallback for secrets.
  /// Returns empty if neither is set. Trims trailing whitespace/newlines
  /// from file contents.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Enforce required fields and record constraints; fill defaults.
  void validate();
};

}  // namespace ddns::common
