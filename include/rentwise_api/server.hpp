#pragma once
#include <crow.h>

#include <cstdint>
#include <future>
#include <string>

namespace rentwise_api {

struct ListenAddress {
  std::string host;
  uint16_t port = 0;
};

// Parses "host:port". Throws std::invalid_argument when the port is missing,
// not a number or out of range.
ListenAddress parse_listen_address(const std::string &address);

// Owns the Crow app and runs it on a background thread. Crow's own signal
// handling is disabled; the process decides when to stop.
class Server {
 public:
  Server(ListenAddress address, unsigned int worker_threads);
  ~Server();

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  void start();
  void stop();

  bool is_running() const {
    return running_;
  }

  const ListenAddress &address() const {
    return address_;
  }

 private:
  crow::SimpleApp app_;
  ListenAddress address_;
  unsigned int worker_threads_;
  std::future<void> run_future_;
  bool running_ = false;
};

}  // namespace rentwise_api
