#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace dyndns::providers {
class IProvider;
}

namespace dyndns::core {

/// Status and plain-text body of one update request.
/// Class abbreviation: ures
struct UpdateResult {
  int iStatus = 200;
  std::string sBody;
};

/// Validates an inbound DynDNS update and applies it per address family.
/// Holds no per-request state; one instance serves all worker threads.
/// Class abbreviation: uh
class UpdateHandler {
 public:
  UpdateHandler(providers::IProvider& ipProvider, common::AllowList alAllowed);
  ~UpdateHandler();

  /// Validation failures become 400/403 results. Each supplied family
  /// (ipv4 → A, ipv6 → AAAA) is updated independently; any provider failure
  /// turns the overall status into 400 without stopping the other family.
  UpdateResult handle(const common::UpdateParams& upParams) const;

  /// Run the local checks and build the validated request.
  /// Throws ValidationError (400) or AuthorizationError (403).
  common::UpdateRequest validate(const common::UpdateParams& upParams) const;

 private:
  /// Update one family; appends the outcome line to vLines.
  /// Returns false if the provider reported an error.
  bool updateFamily(const common::UpdateRequest& urRequest, common::RecordType rtType,
                    const std::string& sAddress, std::vector<std::string>& vLines) const;

  providers::IProvider& _ipProvider;
  common::AllowList _alAllowed;
};

}  // namespace dyndns::core
