#include "app/ApiServer.hpp"
#include <cstdio>

namespace sloguard::app {

ApiServer::ApiServer(ApiRouter& router, uint16_t port)
    : router_(router), port_(port) {}

ApiServer::~ApiServer() = default;

bool ApiServer::start() {
  std::fprintf(stderr, "sloguard: api server: built without liburing, HTTP API on :%d disabled\n", port_);
  return false;
}

void ApiServer::stop() {}

} // namespace sloguard::app
