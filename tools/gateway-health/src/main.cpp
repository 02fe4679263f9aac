#include <cstdlib>
#include <iostream>
#include <string>

#include "core/config.hpp"
#include "health/report.hpp"

namespace {

void print_json(const nlohmann::json& document) {
  std::cout << document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

}  // namespace

int main(int argc, char** argv) {
  const std::string mode_arg = argc > 1 ? argv[1] : "full";
  const auto mode = infer_gateway::health::parse_mode(mode_arg);
  if (!mode.has_value()) {
    print_json(infer_gateway::health::usage_error());
    return 1;
  }

  infer_gateway::core::GatewayConfig config{};
  try {
    if (argc > 2) {
      config = infer_gateway::core::load_gateway_config(argv[2]);
    }
    infer_gateway::core::apply_environment(config, [](const char* name) { return std::getenv(name); });
    infer_gateway::core::validate_config(config);
  } catch (const std::exception& ex) {
    print_json({{"ok", false}, {"error", std::string("config error: ") + ex.what()}});
    return 1;
  }

  const auto checks = infer_gateway::health::run_checks(infer_gateway::health::make_targets(config));
  const auto report = infer_gateway::health::build_report(*mode, checks);
  print_json(report);
  return report.at("ok").get<bool>() ? 0 : 1;
}
