#ifdef SLOGUARD_HAVE_URING

#include "app/ApiServer.hpp"
#include "app/JsonCodec.hpp"
#include "util/Log.hpp"
#include <liburing.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

namespace sloguard::app {

// Tags for distinguishing CQE sources
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

ApiServer::ApiServer(ApiRouter& router, uint16_t port)
    : router_(router), port_(port) {}

ApiServer::~ApiServer() { stop(); }

bool ApiServer::start() {
  if (!open_sockets()) return false;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
  return true;
}

void ApiServer::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    uint64_t val = 1;
    (void)::write(stop_eventfd_, &val, sizeof(val));
    thread_.join();
  }
  close_sockets();
}

void ApiServer::close_sockets() {
  if (stop_eventfd_ >= 0) { ::close(stop_eventfd_); stop_eventfd_ = -1; }
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

// Listener and stop eventfd exist before the server thread does.
bool ApiServer::open_sockets() {
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (listen_fd_ < 0) {
    std::fprintf(stderr, "sloguard: api server: socket() failed: %s\n", std::strerror(errno));
    return false;
  }

  int optval = 1;
  (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  addr.sin_addr.s_addr = INADDR_ANY;

  if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::fprintf(stderr, "sloguard: api server: bind(:%d) failed: %s\n", port_, std::strerror(errno));
    close_sockets();
    return false;
  }
  if (::listen(listen_fd_, 64) < 0) {
    std::fprintf(stderr, "sloguard: api server: listen() failed: %s\n", std::strerror(errno));
    close_sockets();
    return false;
  }

  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    std::fprintf(stderr, "sloguard: api server: eventfd() failed: %s\n", std::strerror(errno));
    close_sockets();
    return false;
  }
  return true;
}

void ApiServer::run(std::stop_token st) {
  struct io_uring ring{};
  if (int rc = io_uring_queue_init(16, &ring, 0); rc < 0) {
    std::fprintf(stderr, "sloguard: api server: io_uring_queue_init() failed: %s\n", std::strerror(-rc));
    return;
  }

  auto submit_poll = [&](int fd, UringTag tag) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
  };

  submit_poll(listen_fd_, UringTag::ListenPoll);
  submit_poll(stop_eventfd_, UringTag::StopPoll);
  io_uring_submit(&ring);

  std::fprintf(stderr, "sloguard: api server listening on :%d\n", port_);

  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      std::fprintf(stderr, "sloguard: api server: io_uring_wait_cqe() failed: %s\n", std::strerror(-ret));
      break;
    }

    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);

    if (tag == UringTag::StopPoll || st.stop_requested()) {
      break;
    }

    if (tag == UringTag::ListenPoll && res >= 0) {
      // Drain the backlog; the listen socket is non-blocking
      for (;;) {
        int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) break;
        handle_client(client_fd);
        ::close(client_fd);
      }
      submit_poll(listen_fd_, UringTag::ListenPoll);
      io_uring_submit(&ring);
    }
  }

  io_uring_queue_exit(&ring);
}

void ApiServer::handle_client(int fd) {
  // Timeouts keep a slow client from stalling the server thread
  struct timeval tv{.tv_sec = 5, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int one = 1;
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  std::string raw;
  raw.reserve(4096);
  char buf[4096];
  HttpRequest req{};
  HttpResponse resp{};
  ParseStatus status = ParseStatus::Incomplete;
  while (status == ParseStatus::Incomplete) {
    ssize_t nr = ::recv(fd, buf, sizeof(buf), 0);
    if (nr <= 0) return;
    raw.append(buf, static_cast<size_t>(nr));
    status = parse_request(raw, req);
  }

  switch (status) {
    case ParseStatus::Complete:
      resp = router_.handle(req);
      sloguard::util::debugf("api server: %s %s -> %d", req.method.c_str(), req.path.c_str(), resp.status);
      break;
    case ParseStatus::TooLarge:
      resp.status = 413;
      resp.body = error_json("payload_too_large", "request exceeds 65536 bytes").dump();
      break;
    case ParseStatus::Invalid:
    case ParseStatus::Incomplete:
      resp.status = 400;
      resp.body = error_json("bad_request", "malformed HTTP request").dump();
      break;
  }

  std::string headers = format_head(resp);

  // Scatter-gather send: headers + body, no concatenation
  struct iovec iov[2] = {
    {.iov_base = headers.data(), .iov_len = headers.size()},
    {.iov_base = resp.body.data(), .iov_len = resp.body.size()}
  };
  struct msghdr msg{};
  msg.msg_iov = iov;
  msg.msg_iovlen = resp.body.empty() ? 1 : 2;
  if (::sendmsg(fd, &msg, MSG_NOSIGNAL) < 0)
    std::fprintf(stderr, "sloguard: api server: send failed: %s\n", std::strerror(errno));
}

} // namespace sloguard::app

#endif // SLOGUARD_HAVE_URING
