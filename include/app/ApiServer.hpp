#pragma once

#include <cstdint>
#include <stop_token>
#include <thread>
#include "app/ApiRouter.hpp"

namespace sloguard::app {

// HTTP/1.1 front end for ApiRouter. One request per connection, handled
// on the server thread; requests are bounded to kMaxRequestBytes.
class ApiServer {
public:
  ApiServer(ApiRouter& router, uint16_t port);
  ~ApiServer();
  ApiServer(const ApiServer&) = delete;
  ApiServer& operator=(const ApiServer&) = delete;

  // Binds the port and starts the server thread. False if the listener
  // could not be set up; the engine keeps running without the API.
  bool start();
  void stop();

private:
  bool open_sockets();
  void close_sockets();
  void run(std::stop_token st);
  void handle_client(int client_fd);

  ApiRouter& router_;
  uint16_t port_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::jthread thread_;
};

} // namespace sloguard::app
