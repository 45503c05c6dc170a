#include "core/RecordPolicy.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace ddns::core {

namespace {

constexpr std::array<std::string_view, 20> kSupportedTypes = {
    "A",     "AAAA",   "CAA", "CERT",  "CNAME", "DNSKEY", "DS",  "HTTPS", "LOC", "MX",
    "NAPTR", "NS",     "PTR", "SMIMEA", "SRV",  "SSHFP",  "SVCB", "TLSA", "TXT", "URI"};

}  // namespace

bool isDynamic(const std::string& sType) { return sType == "A" || sType == "AAAA"; }

bool isSupportedType(const std::string& sType) {
  return std::find(kSupportedTypes.begin(), kSupportedTypes.end(), sType) !=
         kSupportedTypes.end();
}

std::string recordFqdn(const std::string& sRecordName, const std::string& sZoneName) {
  if (sRecordName == "@") {
    return sZoneName;
  }
  return sRecordName + "." + sZoneName;
}

std::string resolveContent(const common::RecordSpec& rsRecord, const std::string& sZoneName,
                           const std::string& sIp) {
  if (isDynamic(rsRecord.sType)) {
    return sIp;
  }
  if (rsRecord.oTarget && !rsRecord.oTarget->empty()) {
    return *rsRecord.oTarget;
  }
  return sZoneName;
}

int recordTtl(bool bProxied) { return bProxied ? kAutoTtl : kDefaultTtl; }

common::RecordPayload buildPayload(const common::RecordSpec& rsRecord,
                                   const std::string& sZoneName, const std::string& sIp) {
  common::RecordPayload rp;
  rp.sType = rsRecord.sType;
  rp.sName = recordFqdn(rsRecord.sName, sZoneName);
  rp.sContent = resolveContent(rsRecord, sZoneName, sIp);
  rp.iTtl = recordTtl(rsRecord.bProxied);
  rp.bProxied = rsRecord.bProxied;
  return rp;
}

}  // namespace ddns::core
