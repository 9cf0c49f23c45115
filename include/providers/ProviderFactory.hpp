#pragma once

#include <memory>

#include "common/Types.hpp"
#include "providers/IProvider.hpp"

namespace dyndns::providers {

class IHttpTransport;

/// Creates the concrete IProvider for pcConfig.sType.
class ProviderFactory {
 public:
  /// Throws std::runtime_error for an unknown provider type.
  /// htTransport must outlive the returned provider.
  static std::unique_ptr<IProvider> create(const common::ProviderConfig& pcConfig,
                                           IHttpTransport& htTransport);
};

}  // namespace dyndns::providers
