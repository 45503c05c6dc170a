#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ddns::common {

/// A record to keep in sync, relative to its zone.
/// Class abbreviation: rs
struct RecordSpec {
  std::string sName;                    // "@" denotes the zone apex
  std::string sType = "A";
  bool bProxied = false;
  std::optional<std::string> oTarget;   // ignored for A/AAAA
};

/// A provider-managed zone and the records configured for it.
/// Class abbreviation: zs
struct ZoneSpec {
  std::string sName;
  std::vector<RecordSpec> vRecords;
};

/// Body of a create or update call.
/// Class abbreviation: rp
struct RecordPayload {
  std::string sType;
  std::string sName;     // fully-qualified
  std::string sContent;
  int iTtl = 300;
  bool bProxied = false;
};

/// Outcome of one reconciliation cycle.
/// Class abbreviation: cr
struct CycleReport {
  bool bIpResolved = false;
  bool bIpChanged = false;
  std::string sIp;
  int iZonesFailed = 0;
  int iRecordsResolved = 0;
  int iRecordsUpdated = 0;
  int iRecordsFailed = 0;
  int iRecordsSkipped = 0;
};

}  // namespace ddns::common
