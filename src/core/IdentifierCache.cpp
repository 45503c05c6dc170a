#include "core/IdentifierCache.hpp"

#include "common/Logger.hpp"
#include "core/RecordPolicy.hpp"

namespace ddns::core {

IdentifierCache::IdentifierCache() = default;
IdentifierCache::~IdentifierCache() = default;

std::string IdentifierCache::recordKey(const common::RecordSpec& rsRecord) {
  return rsRecord.sType + " " + rsRecord.sName;
}

std::string IdentifierCache::getOrResolveZoneId(const std::string& sZoneName,
                                                providers::IDnsProvider& dpProvider) {
  auto& zeEntry = _mZones[sZoneName];
  if (zeEntry.oZoneId) {
    return *zeEntry.oZoneId;
  }

  std::string sZoneId = dpProvider.resolveZoneId(sZoneName);
  zeEntry.oZoneId = sZoneId;
  return sZoneId;
}

std::string IdentifierCache::getOrCreateRecordId(const std::string& sZoneName,
                                                 const std::string& sZoneId,
                                                 const common::RecordSpec& rsRecord,
                                                 const std::string& sIp,
                                                 providers::IDnsProvider& dpProvider) {
  auto& mRecordIds = _mZones[sZoneName].mRecordIds;
  const std::string sKey = recordKey(rsRecord);

  auto it = mRecordIds.find(sKey);
  if (it != mRecordIds.end()) {
    return it->second;
  }

  std::string sRecordId;
  const std::string sFqdn = recordFqdn(rsRecord.sName, sZoneName);
  auto oRecordId = dpProvider.findRecordId(sZoneId, rsRecord.sType, sFqdn);
  if (oRecordId) {
    sRecordId = *oRecordId;
  } else {
    common::Logger::get()->info("Record {} {} not found, creating it...", rsRecord.sType,
                                sFqdn);
    sRecordId = dpProvider.createRecord(sZoneId, buildPayload(rsRecord, sZoneName, sIp));
  }

  mRecordIds[sKey] = sRecordId;
  return sRecordId;
}

std::optional<std::string> IdentifierCache::cachedZoneId(const std::string& sZoneName) const {
  auto it = _mZones.find(sZoneName);
  if (it == _mZones.end()) {
    return std::nullopt;
  }
  return it->second.oZoneId;
}

std::optional<std::string> IdentifierCache::cachedRecordId(
    const std::string& sZoneName, const common::RecordSpec& rsRecord) const {
  auto itZone = _mZones.find(sZoneName);
  if (itZone == _mZones.end()) {
    return std::nullopt;
  }
  auto itRecord = itZone->second.mRecordIds.find(recordKey(rsRecord));
  if (itRecord == itZone->second.mRecordIds.end()) {
    return std::nullopt;
  }
  return itRecord->second;
}

void IdentifierCache::invalidateRecord(const std::string& sZoneName,
                                       const common::RecordSpec& rsRecord) {
  auto itZone = _mZones.find(sZoneName);
  if (itZone != _mZones.end()) {
    itZone->second.mRecordIds.erase(recordKey(rsRecord));
  }
}

}  // namespace ddns::core
