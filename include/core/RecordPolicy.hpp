#pragma once

#include <string>

#include "common/Types.hpp"

namespace ddns::core {

/// TTL the provider interprets as "automatic"; required for proxied records.
inline constexpr int kAutoTtl = 1;
inline constexpr int kDefaultTtl = 300;

/// True for address records (A/AAAA) whose content tracks the public IP.
bool isDynamic(const std::string& sType);

/// True if the provider accepts records of this type.
bool isSupportedType(const std::string& sType);

/// "@" maps to the bare zone name; anything else is "name.zone".
std::string recordFqdn(const std::string& sRecordName, const std::string& sZoneName);

/// Address records get the current IP. Other types get their target, or the
/// zone name when no target is configured.
std::string resolveContent(const common::RecordSpec& rsRecord, const std::string& sZoneName,
                           const std::string& sIp);

int recordTtl(bool bProxied);

/// Assembles the create/update body for a record.
common::RecordPayload buildPayload(const common::RecordSpec& rsRecord,
                                   const std::string& sZoneName, const std::string& sIp);

}  // namespace ddns::core
