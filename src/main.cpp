#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "api/ApiServer.hpp"
#include "api/routes/DynDnsRoutes.hpp"
#include "api/routes/HealthRoutes.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/UpdateHandler.hpp"
#include "providers/CurlHttpTransport.hpp"
#include "providers/ProviderFactory.hpp"

#include <curl/curl.h>
#include <openssl/crypto.h>

namespace {

/// curl_global_init / curl_global_cleanup for the process lifetime.
class CurlGlobal {
 public:
  CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  }
  ~CurlGlobal() { curl_global_cleanup(); }
  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

}  // namespace

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = dyndns::common::Config::load();

    dyndns::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = dyndns::common::Logger::get();
    spLog->info("Step 1: Configuration loaded (zone={}, default TTL={}s)",
                cfgApp.pcProvider.sZone, cfgApp.pcProvider.iDefaultTtl);

    if (cfgApp.alAllowedDomains.mode() == dyndns::common::AllowList::Mode::Unrestricted) {
      spLog->warn("No allowed domains configured: any domain in the zone may be updated");
    } else {
      spLog->info("{} allowed domain(s) configured", cfgApp.alAllowedDomains.domains().size());
    }

    // ── Step 2: HTTP transport ───────────────────────────────────────────
    CurlGlobal cgCurl;
    auto upTransport = std::make_unique<dyndns::providers::CurlHttpTransport>();
    spLog->info("Step 2: HTTP transport initialized");

    // ── Step 3: Provider client ──────────────────────────────────────────
    auto upProvider = dyndns::providers::ProviderFactory::create(cfgApp.pcProvider, *upTransport);

    // Zero API token from Config after handoff
    OPENSSL_cleanse(cfgApp.pcProvider.sToken.data(), cfgApp.pcProvider.sToken.size());
    cfgApp.pcProvider.sToken.clear();

    spLog->info("Step 3: Provider '{}' initialized ({})", upProvider->name(),
                cfgApp.pcProvider.sApiBaseUrl);

    // ── Step 4: Update handler and routes ────────────────────────────────
    auto upHandler = std::make_unique<dyndns::core::UpdateHandler>(*upProvider,
                                                                   cfgApp.alAllowedDomains);
    auto upDynDnsRoutes =
        std::make_unique<dyndns::api::routes::DynDnsRoutes>(*upHandler, cfgApp.sUpdatePath);
    auto upHealthRoutes = std::make_unique<dyndns::api::routes::HealthRoutes>();

    auto upServer = std::make_unique<dyndns::api::ApiServer>(*upDynDnsRoutes, *upHealthRoutes);
    upServer->registerRoutes();
    spLog->info("Step 4: Routes registered (update path {})", cfgApp.sUpdatePath);

    // ── Step 5: Serve ────────────────────────────────────────────────────
    if (cfgApp.oBindSocket.has_value()) {
      upServer->startUnixSocket(*cfgApp.oBindSocket, cfgApp.iHttpThreads);
    } else {
      upServer->start(cfgApp.sBindHost, cfgApp.iHttpPort, cfgApp.iHttpThreads);
    }

    spLog->info("dyndns-bridge stopped");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
