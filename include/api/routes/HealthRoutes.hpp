#pragma once

#include <crow.h>

namespace dyndns::api::routes {

/// Handler for /health
class HealthRoutes {
 public:
  HealthRoutes();
  ~HealthRoutes();

  void registerRoutes(crow::SimpleApp& app);
};

}  // namespace dyndns::api::routes
