#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "server/gateway_server.hpp"
#include "server/router.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  infer_gateway::core::GatewayConfig config{};
  try {
    if (argc > 1) {
      config = infer_gateway::core::load_gateway_config(argv[1]);
    }
    infer_gateway::core::apply_environment(config, [](const char* name) { return std::getenv(name); });
    infer_gateway::core::validate_config(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << infer_gateway::core::format_config_settings(config) << '\n';

  infer_gateway::server::GatewayServer server{infer_gateway::server::make_gateway_router(config)};
  if (server.bind(config.bind_address, config.port) < 0) {
    std::cerr << "[gateway] failed to bind " << config.bind_address << ':' << config.port << '\n';
    return 1;
  }

  std::atomic<bool> listen_ok{true};
  std::thread listener([&server, &listen_ok] { listen_ok = server.listen_after_bind(); });
  server.wait_until_ready();

  while (g_shutdown_requested == 0 && server.is_running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  if (g_shutdown_requested != 0) {
    std::cerr << "[gateway] shutdown signal received; exiting cleanly\n";
  }
  server.stop();
  listener.join();

  return listen_ok ? 0 : 1;
}
