#pragma once

#include <string>

#include <crow.h>

namespace dyndns::api::routes {
class DynDnsRoutes;
class HealthRoutes;
}  // namespace dyndns::api::routes

namespace dyndns::api {

/// Owns the Crow application instance; registers all routes at startup.
/// Class abbreviation: api
class ApiServer {
 public:
  ApiServer(routes::DynDnsRoutes& ddrRoutes, routes::HealthRoutes& hrRoutes);
  ~ApiServer();

  void registerRoutes();

  /// Serve on a TCP address. Blocks until SIGINT/SIGTERM.
  void start(const std::string& sBindHost, int iPort, int iThreads);

  /// Serve on a UNIX domain socket. Blocks until SIGINT/SIGTERM.
  void startUnixSocket(const std::string& sSocketPath, int iThreads);

 private:
  crow::SimpleApp _app;
  routes::DynDnsRoutes& _ddrRoutes;
  routes::HealthRoutes& _hrRoutes;
};

}  // namespace dyndns::api
