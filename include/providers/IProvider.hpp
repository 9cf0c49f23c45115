#pragma once

#include <optional>
#include <string>

#include "common/Types.hpp"

namespace dyndns::providers {

/// Pure abstract interface for the DNS provider integration.
/// All failures are reported as common::ApiError.
class IProvider {
 public:
  virtual ~IProvider() = default;

  virtual std::string name() const = 0;

  /// Identifier of the single record matching (name, type) in the zone.
  virtual std::string findRecordId(const std::string& sName, common::RecordType rtType) = 0;

  /// Look up the record and replace its content. A missing or too small
  /// oTtl falls back to the configured default.
  virtual common::ResourceRecord updateRecord(const std::string& sName,
                                              common::RecordType rtType,
                                              const std::string& sContent,
                                              std::optional<int> oTtl) = 0;
};

}  // namespace dyndns::providers
