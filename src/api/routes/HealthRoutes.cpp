#include "api/routes/HealthRoutes.hpp"

namespace dyndns::api::routes {

HealthRoutes::HealthRoutes() = default;
HealthRoutes::~HealthRoutes() = default;

void HealthRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /health
  CROW_ROUTE(app, "/health").methods("GET"_method)([]() {
    crow::response resp(200, "OK");
    resp.set_header("Content-Type", "text/plain");
    return resp;
  });
}

}  // namespace dyndns::api::routes
