#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"
#include "core/IdentifierCache.hpp"
#include "ip/IIpResolver.hpp"
#include "providers/IDnsProvider.hpp"

namespace ddns::core {

/// Brings the configured zones in line with the current public IP, one cycle
/// per call. Address records (A/AAAA) follow the IP; every other record is
/// ensured to exist once and then left alone.
///
/// The engine owns the identifier cache and the last known IP. Provider and
/// resolver are borrowed and must outlive the engine.
/// Class abbreviation: re
class ReconciliationEngine {
 public:
  ReconciliationEngine(std::vector<common::ZoneSpec> vZones,
                       providers::IDnsProvider& dpProvider, ip::IIpResolver& irResolver);
  ~ReconciliationEngine();

  /// Run one cycle. Never throws for provider or resolver failures; they are
  /// logged and retried on the next call.
  common::CycleReport runCycle();

  const std::string& lastKnownIp() const { return _sLastKnownIp; }
  const IdentifierCache& cache() const { return _icCache; }

 private:
  void reconcileZone(const common::ZoneSpec& zsZone, const std::string& sIp, bool bIpChanged,
                     common::CycleReport& crReport);
  void reconcileRecord(const common::ZoneSpec& zsZone, const std::string& sZoneId,
                       const common::RecordSpec& rsRecord, const std::string& sIp,
                       bool bIpChanged, common::CycleReport& crReport);

  std::vector<common::ZoneSpec> _vZones;
  providers::IDnsProvider& _dpProvider;
  ip::IIpResolver& _irResolver;
  IdentifierCache _icCache;
  std::string _sLastKnownIp;
};

}  // namespace ddns::core
