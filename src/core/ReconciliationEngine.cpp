#include "core/ReconciliationEngine.hpp"

#include "common/Logger.hpp"
#include "core/RecordPolicy.hpp"

#include <exception>
#include <utility>

namespace ddns::core {

ReconciliationEngine::ReconciliationEngine(std::vector<common::ZoneSpec> vZones,
                                           providers::IDnsProvider& dpProvider,
                                           ip::IIpResolver& irResolver)
    : _vZones(std::move(vZones)), _dpProvider(dpProvider), _irResolver(irResolver) {}

ReconciliationEngine::~ReconciliationEngine() = default;

common::CycleReport ReconciliationEngine::runCycle() {
  auto spLog = common::Logger::get();
  common::CycleReport crReport;

  std::string sIp;
  try {
    sIp = _irResolver.fetch();
  } catch (const std::exception& ex) {
    // Last known IP stays at the last successful fetch.
    spLog->error("Failed to get public IP: {}", ex.what());
    return crReport;
  }

  crReport.bIpResolved = true;
  crReport.sIp = sIp;
  crReport.bIpChanged = sIp != _sLastKnownIp;
  if (crReport.bIpChanged) {
    spLog->info("Public IP changed to {}", sIp);
  } else {
    spLog->info("IP hasn't changed");
  }
  _sLastKnownIp = sIp;

  for (const auto& zsZone : _vZones) {
    reconcileZone(zsZone, sIp, crReport.bIpChanged, crReport);
  }
  return crReport;
}

void ReconciliationEngine::reconcileZone(const common::ZoneSpec& zsZone, const std::string& sIp,
                                         bool bIpChanged, common::CycleReport& crReport) {
  std::string sZoneId;
  try {
    sZoneId = _icCache.getOrResolveZoneId(zsZone.sName, _dpProvider);
  } catch (const std::exception& ex) {
    common::Logger::get()->error("[{}] Failed to get zone ID: {}", zsZone.sName, ex.what());
    ++crReport.iZonesFailed;
    return;
  }

  for (const auto& rsRecord : zsZone.vRecords) {
    reconcileRecord(zsZone, sZoneId, rsRecord, sIp, bIpChanged, crReport);
  }
}

void ReconciliationEngine::reconcileRecord(const common::ZoneSpec& zsZone,
                                           const std::string& sZoneId,
                                           const common::RecordSpec& rsRecord,
                                           const std::string& sIp, bool bIpChanged,
                                           common::CycleReport& crReport) {
  auto spLog = common::Logger::get();
  const bool bDynamic = isDynamic(rsRecord.sType);
  const bool bCached = _icCache.cachedRecordId(zsZone.sName, rsRecord).has_value();

  // Address records are only touched when the IP moves. Static records are
  // reconciled once per process lifetime.
  if (bDynamic ? !bIpChanged : bCached) {
    spLog->debug("[{}] [{} {}] Up to date, skipping", zsZone.sName, rsRecord.sType,
                 rsRecord.sName);
    ++crReport.iRecordsSkipped;
    return;
  }

  std::string sRecordId;
  try {
    sRecordId = _icCache.getOrCreateRecordId(zsZone.sName, sZoneId, rsRecord, sIp, _dpProvider);
  } catch (const std::exception& ex) {
    spLog->error("[{}] [{}] Failed to get/create record: {}", zsZone.sName, rsRecord.sName,
                 ex.what());
    ++crReport.iRecordsFailed;
    return;
  }
  if (!bCached) {
    ++crReport.iRecordsResolved;
  }

  if (!bDynamic) {
    return;
  }

  try {
    _dpProvider.updateRecord(sZoneId, sRecordId, buildPayload(rsRecord, zsZone.sName, sIp));
  } catch (const std::exception& ex) {
    // The identifier may be stale; force a full rediscovery next cycle.
    _icCache.invalidateRecord(zsZone.sName, rsRecord);
    spLog->error("[{}] [{}] Failed to update record: {}", zsZone.sName, rsRecord.sName,
                 ex.what());
    ++crReport.iRecordsFailed;
    return;
  }

  ++crReport.iRecordsUpdated;
  spLog->info("[{}] [{} {}] Updated to {} (proxied={})", zsZone.sName, rsRecord.sType,
              rsRecord.sName, sIp, rsRecord.bProxied);
}

}  // namespace ddns::core
