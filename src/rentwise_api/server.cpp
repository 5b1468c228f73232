#include "rentwise_api/server.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace rentwise_api {

ListenAddress parse_listen_address(const std::string &address) {
  const auto colon = address.rfind(':');
  if (colon == std::string::npos || colon + 1 == address.size()) {
    throw std::invalid_argument("Listen address must be host:port, got '" + address + "'");
  }

  ListenAddress parsed;
  parsed.host = address.substr(0, colon);
  if (parsed.host.empty()) {
    parsed.host = "0.0.0.0";
  }

  const std::string port = address.substr(colon + 1);
  if (port.find_first_not_of("0123456789") != std::string::npos || port.size() > 5) {
    throw std::invalid_argument("Invalid port in listen address '" + address + "'");
  }
  const int value = std::stoi(port);
  if (value <= 0 || value > 65535) {
    throw std::invalid_argument("Port out of range in listen address '" + address + "'");
  }
  parsed.port = static_cast<uint16_t>(value);
  return parsed;
}

Server::Server(ListenAddress address, unsigned int worker_threads)
    : address_(std::move(address)), worker_threads_(worker_threads == 0 ? 1 : worker_threads) {
  app_.signal_clear();
}

Server::~Server() {
  try {
    stop();
  } catch (const std::exception &e) {
    std::cerr << "Server stopped with an error: " << e.what() << std::endl;
  }
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  std::cout << "Listening on " << address_.host << ":" << address_.port << " with "
            << worker_threads_ << " worker threads" << std::endl;
  run_future_ = std::async(std::launch::async, [this] {
    app_.bindaddr(address_.host).port(address_.port).concurrency(worker_threads_).run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();
  if (run_future_.valid()) {
    run_future_.get();
  }
  running_ = false;
}

}  // namespace rentwise_api
