#include "api/ApiServer.hpp"

#include "api/routes/DynDnsRoutes.hpp"
#include "api/routes/HealthRoutes.hpp"
#include "common/Logger.hpp"

#include <cstdint>

namespace dyndns::api {

ApiServer::ApiServer(routes::DynDnsRoutes& ddrRoutes, routes::HealthRoutes& hrRoutes)
    : _ddrRoutes(ddrRoutes), _hrRoutes(hrRoutes) {
  // Request logging goes through spdlog; keep Crow's own logger quiet.
  _app.loglevel(crow::LogLevel::Warning);
}

ApiServer::~ApiServer() = default;

void ApiServer::registerRoutes() {
  _ddrRoutes.registerRoutes(_app);
  _hrRoutes.registerRoutes(_app);
}

void ApiServer::start(const std::string& sBindHost, int iPort, int iThreads) {
  common::Logger::get()->info("Listening on {}:{} ({} threads)", sBindHost, iPort, iThreads);
  _app.bindaddr(sBindHost)
      .port(static_cast<std::uint16_t>(iPort))
      .concurrency(static_cast<std::uint16_t>(iThreads))
      .run();
}

void ApiServer::startUnixSocket(const std::string& sSocketPath, int iThreads) {
  common::Logger::get()->info("Listening on unix:{} ({} threads)", sSocketPath, iThreads);
  _app.local_socket_path(sSocketPath)
      .concurrency(static_cast<std::uint16_t>(iThreads))
      .run();
}

}  // namespace dyndns::api
