#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <httplib.h>

#include "server/router.hpp"

namespace infer_gateway::server {

// Runs each accepted connection on its own detached thread. shutdown() waits
// until every running connection has finished.
class ThreadPerConnectionQueue final : public httplib::TaskQueue {
 public:
  bool enqueue(std::function<void()> fn) override;
  void shutdown() override;

 private:
  std::mutex mutex_;
  std::condition_variable idle_;
  std::size_t active_{0};
};

// HTTP front end for a GatewayRouter.
class GatewayServer {
 public:
  explicit GatewayServer(std::shared_ptr<GatewayRouter> router);

  GatewayServer(const GatewayServer&) = delete;
  GatewayServer& operator=(const GatewayServer&) = delete;

  // Port 0 picks an ephemeral port. Returns the bound port, or -1.
  int bind(const std::string& address, int port);

  // Blocks until stop() is called. Returns false if the accept loop failed.
  bool listen_after_bind();

  void stop();
  [[nodiscard]] bool is_running() const;
  void wait_until_ready() const;

 private:
  void install_routes();
  void serve(const httplib::Request& request, httplib::Response& response);

  std::shared_ptr<GatewayRouter> router_;
  httplib::Server server_;
};

}  // namespace infer_gateway::server
