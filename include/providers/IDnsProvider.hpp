#pragma once

#include <optional>
#include <string>

#include "common/Types.hpp"

namespace ddns::providers {

/// Pure abstract interface for the DNS provider operations the
/// reconciliation engine needs. Every call is a single remote request and
/// reports failure by throwing a common::AppError subclass.
class IDnsProvider {
 public:
  virtual ~IDnsProvider() = default;

  virtual std::string name() const = 0;

  /// Throws NotFoundError when no zone carries this exact name.
  virtual std::string resolveZoneId(const std::string& sZoneName) = 0;

  /// Returns std::nullopt when no record matches type and FQDN.
  virtual std::optional<std::string> findRecordId(const std::string& sZoneId,
                                                  const std::string& sType,
                                                  const std::string& sFqdn) = 0;

  /// Returns the identifier of the new record.
  virtual std::string createRecord(const std::string& sZoneId,
                                   const common::RecordPayload& rpPayload) = 0;

  virtual void updateRecord(const std::string& sZoneId, const std::string& sRecordId,
                            const common::RecordPayload& rpPayload) = 0;
};

}  // namespace ddns::providers
