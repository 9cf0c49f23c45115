#include "providers/ProviderFactory.hpp"

#include "providers/HostingDeProvider.hpp"

#include <stdexcept>

namespace dyndns::providers {

std::unique_ptr<IProvider> ProviderFactory::create(const common::ProviderConfig& pcConfig,
                                                   IHttpTransport& htTransport) {
  if (pcConfig.sType == "hostingde") {
    return std::make_unique<HostingDeProvider>(pcConfig, htTransport);
  }
  throw std::runtime_error{"Unsupported provider type: " + pcConfig.sType};
}

}  // namespace dyndns::providers
