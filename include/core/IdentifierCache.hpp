#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "common/Types.hpp"
#include "providers/IDnsProvider.hpp"

namespace ddns::core {

/// In-memory memo of provider identifiers, filled lazily and never persisted.
/// Zone identifiers live for the whole run once resolved. Record identifiers
/// are keyed by record type and name within a zone, and are dropped only
/// through invalidateRecord().
/// Not thread-safe; owned by a single ReconciliationEngine.
/// Class abbreviation: ic
class IdentifierCache {
 public:
  IdentifierCache();
  ~IdentifierCache();

  /// Cached zone identifier, else ask the provider and remember the answer.
  /// Provider errors propagate and leave the zone unresolved.
  std::string getOrResolveZoneId(const std::string& sZoneName,
                                 providers::IDnsProvider& dpProvider);

  /// Cached record identifier, else find it remotely, else create the record
  /// with content derived from sIp. The identifier is cached on both paths.
  std::string getOrCreateRecordId(const std::string& sZoneName, const std::string& sZoneId,
                                  const common::RecordSpec& rsRecord, const std::string& sIp,
                                  providers::IDnsProvider& dpProvider);

  std::optional<std::string> cachedZoneId(const std::string& sZoneName) const;
  std::optional<std::string> cachedRecordId(const std::string& sZoneName,
                                            const common::RecordSpec& rsRecord) const;

  /// Forget a record identifier so the next cycle rediscovers it.
  void invalidateRecord(const std::string& sZoneName, const common::RecordSpec& rsRecord);

 private:
  struct ZoneEntry {
    std::optional<std::string> oZoneId;
    std::unordered_map<std::string, std::string> mRecordIds;
  };

  static std::string recordKey(const common::RecordSpec& rsRecord);

  std::unordered_map<std::string, ZoneEntry> _mZones;
};

}  // namespace ddns::core
