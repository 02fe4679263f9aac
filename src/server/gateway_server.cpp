#include "server/gateway_server.hpp"

#include <exception>
#include <iostream>
#include <system_error>
#include <thread>
#include <utility>

namespace infer_gateway::server {
namespace {

constexpr const char* kAnyPath = R"(.*)";

}  // namespace

bool ThreadPerConnectionQueue::enqueue(std::function<void()> fn) {
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    ++active_;
  }

  try {
    std::thread([this, task = std::move(fn)] {
      task();
      const std::lock_guard<std::mutex> lock(mutex_);
      --active_;
      idle_.notify_all();
    }).detach();
  } catch (const std::system_error& ex) {
    std::cerr << "[gateway] failed to start connection thread: " << ex.what() << '\n';
    const std::lock_guard<std::mutex> lock(mutex_);
    --active_;
    return false;
  }
  return true;
}

void ThreadPerConnectionQueue::shutdown() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_.wait(lock, [this] { return active_ == 0; });
}

GatewayServer::GatewayServer(std::shared_ptr<GatewayRouter> router) : router_(std::move(router)) {
  server_.new_task_queue = [] { return new ThreadPerConnectionQueue(); };
  install_routes();
}

void GatewayServer::install_routes() {
  const auto handler = [this](const httplib::Request& request, httplib::Response& response) {
    serve(request, response);
  };

  server_.Get(kAnyPath, handler);
  server_.Post(kAnyPath, handler);
  server_.Put(kAnyPath, handler);
  server_.Patch(kAnyPath, handler);
  server_.Delete(kAnyPath, handler);
  server_.Options(kAnyPath, handler);

  server_.set_exception_handler([](const httplib::Request& request, httplib::Response& response,
                                   std::exception_ptr error) {
    try {
      std::rethrow_exception(error);
    } catch (const std::exception& ex) {
      std::cerr << "[gateway] " << request.method << ' ' << request.path << " failed: " << ex.what() << '\n';
    } catch (...) {
      std::cerr << "[gateway] " << request.method << ' ' << request.path << " failed: unknown exception\n";
    }
    response.status = 500;
    response.set_content(R"({"error":"Internal Server Error"})", "application/json");
  });
}

void GatewayServer::serve(const httplib::Request& request, httplib::Response& response) {
  GatewayRequest gateway_request{};
  gateway_request.method = request.method;
  gateway_request.path = request.path;
  gateway_request.body = request.body;
  if (request.has_header("Authorization")) {
    gateway_request.authorization = request.get_header_value("Authorization");
  }

  auto reply = router_->handle(gateway_request);
  response.status = reply.status;
  response.set_content(std::move(reply.body), reply.content_type);
}

int GatewayServer::bind(const std::string& address, const int port) {
  if (port == 0) {
    return server_.bind_to_any_port(address);
  }
  return server_.bind_to_port(address, port) ? port : -1;
}

bool GatewayServer::listen_after_bind() { return server_.listen_after_bind(); }

void GatewayServer::stop() { server_.stop(); }

bool GatewayServer::is_running() const { return server_.is_running(); }

void GatewayServer::wait_until_ready() const { server_.wait_until_ready(); }

}  // namespace infer_gateway::server
