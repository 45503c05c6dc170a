#include "common/Config.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/RecordPolicy.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace ddns::common {

namespace {

constexpr int kDefaultPollIntervalSeconds = 300;
constexpr int kDefaultRequestTimeoutSeconds = 30;

std::string toUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

RecordSpec parseRecord(const nlohmann::json& jRecord, const std::string& sZoneName) {
  if (!jRecord.is_object()) {
    throw ValidationError("invalid_config",
                          "Zone '" + sZoneName + "': each record must be an object");
  }

  RecordSpec rs;
  rs.sName = jRecord.value("name", "");
  rs.sType = toUpper(jRecord.value("type", ""));
  rs.bProxied = jRecord.value("proxied", false);

  const std::string sTarget = jRecord.value("target", "");
  if (!sTarget.empty()) {
    rs.oTarget = sTarget;
  }
  return rs;
}

ZoneSpec parseZone(const nlohmann::json& jZone) {
  if (!jZone.is_object()) {
    throw ValidationError("invalid_config", "Each zone must be an object");
  }

  ZoneSpec zs;
  zs.sName = jZone.value("name", "");

  auto it = jZone.find("records");
  if (it != jZone.end()) {
    if (!it->is_array()) {
      throw ValidationError("invalid_config",
                            "Zone '" + zs.sName + "': 'records' must be an array");
    }
    for (const auto& jRecord : *it) {
      zs.vRecords.push_back(parseRecord(jRecord, zs.sName));
    }
  }
  return zs;
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

std::string Config::loadSecret(const char* pVarName) {
  // Try the direct env var first
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  // Try _FILE fallback
  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return {};
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw ValidationError("invalid_config",
                          "Cannot open secret file specified by " + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw ValidationError("invalid_config",
                          "Secret file is empty: " + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::load(const std::string& sPath) {
  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    throw ValidationError("config_not_found", "Cannot open config file: " + sPath);
  }

  Config cfg;
  try {
    const auto jRoot = nlohmann::json::parse(ifs);
    if (!jRoot.is_object()) {
      throw ValidationError("invalid_config", "Config root must be a JSON object");
    }

    cfg.iPollIntervalSeconds = jRoot.value("poll_interval", 0);
    cfg.sApiToken = jRoot.value("cloudflare_api_token", "");
    cfg.sIpProvider = jRoot.value("ip_provider", "");
    cfg.sLogLevel = jRoot.value("log_level", cfg.sLogLevel);
    cfg.iRequestTimeoutSeconds = jRoot.value("request_timeout_seconds", 0);
    cfg.sApiBaseUrl = jRoot.value("api_base_url", cfg.sApiBaseUrl);

    auto it = jRoot.find("zones");
    if (it != jRoot.end()) {
      if (!it->is_array()) {
        throw ValidationError("invalid_config", "'zones' must be an array");
      }
      for (const auto& jZone : *it) {
        cfg.vZones.push_back(parseZone(jZone));
      }
    }
  } catch (const nlohmann::json::exception& ex) {
    throw ValidationError("invalid_config",
                          "Failed to parse config " + sPath + ": " + ex.what());
  }

  // ── Environment overrides ──────────────────────────────────────────────
  const std::string sEnvToken = loadSecret("DDNS_CLOUDFLARE_API_TOKEN");
  if (!sEnvToken.empty()) {
    cfg.sApiToken = sEnvToken;
  }
  const std::string sEnvIpProvider = getEnv("DDNS_IP_PROVIDER");
  if (!sEnvIpProvider.empty()) {
    cfg.sIpProvider = sEnvIpProvider;
  }
  const std::string sEnvLogLevel = getEnv("DDNS_LOG_LEVEL");
  if (!sEnvLogLevel.empty()) {
    cfg.sLogLevel = sEnvLogLevel;
  }
  const std::string sEnvInterval = getEnv("DDNS_POLL_INTERVAL");
  if (!sEnvInterval.empty()) {
    try {
      cfg.iPollIntervalSeconds = std::stoi(sEnvInterval);
    } catch (const std::exception&) {
      throw ValidationError("invalid_config",
                            "Invalid integer value for DDNS_POLL_INTERVAL: " + sEnvInterval);
    }
  }

  cfg.validate();
  return cfg;
}

void Config::validate() {
  if (sApiToken.empty()) {
    throw ValidationError("missing_token", "cloudflare_api_token is required in config");
  }
  if (sIpProvider.empty()) {
    throw ValidationError("missing_ip_provider", "ip_provider is required in config");
  }
  if (vZones.empty()) {
    throw ValidationError("missing_zones", "At least one zone must be defined in config");
  }

  if (iPollIntervalSeconds <= 0) {
    iPollIntervalSeconds = kDefaultPollIntervalSeconds;
  }
  if (iRequestTimeoutSeconds <= 0) {
    iRequestTimeoutSeconds = kDefaultRequestTimeoutSeconds;
  }
  if (sLogLevel.empty()) {
    sLogLevel = "info";
  }
  Logger::parseLevel(sLogLevel);

  for (auto& zs : vZones) {
    if (zs.sName.empty()) {
      throw ValidationError("invalid_zone", "Every zone requires a non-empty name");
    }
    for (auto& rs : zs.vRecords) {
      if (rs.sName.empty()) {
        throw ValidationError("invalid_record",
                              "Zone '" + zs.sName + "': every record requires a name");
      }
      if (rs.sType.empty()) {
        rs.sType = "A";
      }
      if (!core::isSupportedType(rs.sType)) {
        throw ValidationError("invalid_record",
                              "Zone '" + zs.sName + "': record '" + rs.sName +
                                  "' has unsupported type " + rs.sType);
      }
    }
  }
}

std::string Config::ipLookupUrl() const {
  if (sIpProvider.find("://") != std::string::npos) {
    return sIpProvider;
  }
  return "https://" + sIpProvider;
}

}  // namespace ddns::common
