#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "dispatch/forwarder.hpp"
#include "server/gateway_server.hpp"
#include "server/handlers.hpp"
#include "server/router.hpp"
#include "server/static_files.hpp"
#include "telemetry/collector.hpp"

using infer_gateway::core::GatewayConfig;
using infer_gateway::core::apply_environment;
using infer_gateway::core::load_gateway_config;
using infer_gateway::core::make_model_catalog;
using infer_gateway::core::validate_config;
using infer_gateway::dispatch::DispatchForwarder;
using infer_gateway::dispatch::ForwarderOptions;
using infer_gateway::dispatch::build_chat_payload;
using infer_gateway::dispatch::extract_message_content;
using infer_gateway::dispatch::split_backend_url;
using infer_gateway::server::GatewayRequest;
using infer_gateway::server::GatewayRouter;
using infer_gateway::server::GatewayServer;
using infer_gateway::server::HttpReply;
using infer_gateway::server::StaticFiles;
using infer_gateway::telemetry::TelemetryCollector;

namespace {

bool almost_equal(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

// Records what the last request to the fake backend looked like.
struct CapturedRequest {
  std::string path;
  std::string body;
  std::string authorization;
  int count{0};
};

// In-process OpenAI-style backend on an ephemeral loopback port.
class FakeBackend {
 public:
  using Responder = std::function<void(const httplib::Request&, httplib::Response&)>;

  explicit FakeBackend(Responder responder) : responder_(std::move(responder)) {
    const auto handler = [this](const httplib::Request& request, httplib::Response& response) {
      {
        const std::lock_guard<std::mutex> lock(mutex_);
        captured_.path = request.path;
        captured_.body = request.body;
        captured_.authorization = request.get_header_value("Authorization");
        captured_.count += 1;
      }
      responder_(request, response);
    };
    server_.Post(R"(.*)", handler);
    server_.Get(R"(.*)", handler);

    port_ = server_.bind_to_any_port("127.0.0.1");
    if (port_ <= 0) {
      throw std::runtime_error("fake backend failed to bind");
    }
    thread_ = std::thread([this] { server_.listen_after_bind(); });
    server_.wait_until_ready();
  }

  ~FakeBackend() {
    server_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  FakeBackend(const FakeBackend&) = delete;
  FakeBackend& operator=(const FakeBackend&) = delete;

  [[nodiscard]] std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

  CapturedRequest captured() {
    const std::lock_guard<std::mutex> lock(mutex_);
    return captured_;
  }

 private:
  Responder responder_;
  httplib::Server server_;
  std::thread thread_;
  int port_{0};
  std::mutex mutex_;
  CapturedRequest captured_;
};

void reply_with_completion(const httplib::Request&, httplib::Response& response) {
  response.set_content(R"({"id":"cmpl-1","choices":[{"index":0,"message":{"role":"assistant","content":"42"}}]})",
                       "application/json");
}

class ScratchDir {
 public:
  ScratchDir() {
    char pattern[] = "/tmp/infer-gateway-tests-XXXXXX";
    const char* created = mkdtemp(pattern);
    if (created == nullptr) {
      throw std::runtime_error("mkdtemp failed");
    }
    path_ = created;
  }

  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  std::filesystem::path write(const std::string& relative, const std::string& content) const {
    const auto file = path_ / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary);
    out << content;
    return file;
  }

 private:
  std::filesystem::path path_;
};

std::unique_ptr<GatewayRouter> make_router(const GatewayConfig& config, const std::filesystem::path& static_root) {
  GatewayRouter::Components components{};
  components.catalog = make_model_catalog(config);
  components.forwarder = std::make_shared<const DispatchForwarder>(
      ForwarderOptions{.timeout = std::chrono::seconds(5), .max_tokens = config.max_tokens});
  components.collector = std::make_unique<TelemetryCollector>(TelemetryCollector::Sources{});
  components.static_root = static_root;
  return std::make_unique<GatewayRouter>(std::move(components));
}

GatewayConfig config_for(const std::string& reasoning_url, const std::string& multimodal_url) {
  GatewayConfig config{};
  config.reasoning.url = reasoning_url;
  config.multimodal.url = multimodal_url;
  return config;
}

HttpReply post(GatewayRouter& router, const std::string& path, const std::string& body,
               const std::optional<std::string>& authorization = std::nullopt) {
  return router.handle(GatewayRequest{"POST", path, body, authorization});
}

HttpReply get(GatewayRouter& router, const std::string& path) {
  return router.handle(GatewayRequest{"GET", path, "", std::nullopt});
}

int test_config_defaults_and_file_layering() {
  const GatewayConfig defaults{};
  if (defaults.port != 8080 || defaults.reasoning.url != "http://127.0.0.1:8355" ||
      defaults.multimodal.model_id != "nvidia/Phi-4-multimodal-instruct-NVFP4" ||
      defaults.dispatch_timeout != std::chrono::seconds(600)) {
    return fail("test_config_defaults_and_file_layering", "defaults mismatch");
  }

  ScratchDir dir;
  const auto path = dir.write("gateway.yaml",
                              "# gateway\n"
                              "server:\n"
                              "  port: 9090\n"
                              "  static_dir: \"/srv/ui\"\n"
                              "backends:\n"
                              "  reasoning:\n"
                              "    url: http://10.0.0.5:8355  # primary\n"
                              "    alias: reasoner\n"
                              "  multimodal:\n"
                              "    model_id: vendor/vision-model\n"
                              "dispatch:\n"
                              "  timeout_s: 30\n"
                              "  max_tokens: 64\n"
                              "telemetry:\n"
                              "  nvidia_smi: /opt/bin/nvidia-smi\n"
                              "unknown:\n"
                              "  key: ignored\n");

  auto config = load_gateway_config(path.string());
  if (config.port != 9090 || config.static_dir != "/srv/ui" || config.reasoning.url != "http://10.0.0.5:8355" ||
      config.reasoning.alias != "reasoner" || config.reasoning.model_id != "nvidia/Phi-4-reasoning-plus-FP8" ||
      config.multimodal.model_id != "vendor/vision-model" || config.dispatch_timeout != std::chrono::seconds(30) ||
      config.max_tokens != 64 || config.telemetry.nvidia_smi != "/opt/bin/nvidia-smi") {
    return fail("test_config_defaults_and_file_layering", "file values not applied");
  }

  const std::map<std::string, std::string> env{{"PUBLIC_PORT", "7000"},
                                               {"MULTIMODAL_URL", "http://gpu-box:8356"},
                                               {"MODEL_MULTIMODAL_ALIAS", "vision"},
                                               {"STATIC_DIR", ""}};
  apply_environment(config, [&env](const char* name) -> const char* {
    const auto it = env.find(name);
    return it == env.end() ? nullptr : it->second.c_str();
  });

  if (config.port != 7000 || config.multimodal.url != "http://gpu-box:8356" || config.multimodal.alias != "vision" ||
      config.static_dir != "/srv/ui" || config.reasoning.alias != "reasoner") {
    return fail("test_config_defaults_and_file_layering", "environment overrides mismatch");
  }

  validate_config(config);
  return 0;
}

int test_config_rejects_invalid_values() {
  ScratchDir dir;
  const std::vector<std::string> bad_files{
      "server:\n  port: 70000\n",
      "server:\n  port: eighty\n",
      "dispatch:\n  timeout_s: 0\n",
      "dispatch:\n  max_tokens: 12abc\n",
  };

  for (std::size_t i = 0; i < bad_files.size(); ++i) {
    const auto path = dir.write("bad" + std::to_string(i) + ".yaml", bad_files[i]);
    bool threw = false;
    try {
      static_cast<void>(load_gateway_config(path.string()));
    } catch (const std::runtime_error&) {
      threw = true;
    }
    if (!threw) {
      return fail("test_config_rejects_invalid_values", "invalid file value must throw runtime_error");
    }
  }

  bool missing_threw = false;
  try {
    static_cast<void>(load_gateway_config((dir.path() / "absent.yaml").string()));
  } catch (const std::runtime_error&) {
    missing_threw = true;
  }
  if (!missing_threw) {
    return fail("test_config_rejects_invalid_values", "missing config file must throw");
  }

  GatewayConfig duplicate{};
  duplicate.multimodal.alias = duplicate.reasoning.alias;
  GatewayConfig bad_url{};
  bad_url.reasoning.url = "127.0.0.1:8355";
  GatewayConfig empty_id{};
  empty_id.multimodal.model_id.clear();
  GatewayConfig tls_url{};
  tls_url.reasoning.url = "https://gpu.example:8443";

  for (const auto* config : {&duplicate, &bad_url, &empty_id, &tls_url}) {
    bool threw = false;
    try {
      validate_config(*config);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    if (!threw) {
      return fail("test_config_rejects_invalid_values", "invalid configuration must fail validation");
    }
  }
  return 0;
}

int test_backend_url_split_and_payload_shape() {
  const auto plain = split_backend_url("http://127.0.0.1:8355");
  const auto prefixed = split_backend_url("http://gpu.example:8000/serving/");
  if (!plain.has_value() || plain->origin != "http://127.0.0.1:8355" || !plain->path_prefix.empty() ||
      !prefixed.has_value() || prefixed->origin != "http://gpu.example:8000" ||
      prefixed->path_prefix != "/serving") {
    return fail("test_backend_url_split_and_payload_shape", "url split mismatch");
  }
  if (split_backend_url("not a url").has_value() || split_backend_url("://host").has_value()) {
    return fail("test_backend_url_split_and_payload_shape", "url without scheme must be rejected");
  }
  if (split_backend_url("https://gpu.example:8443").has_value()) {
    return fail("test_backend_url_split_and_payload_shape", "only http:// backends are supported");
  }

  const auto catalog = make_model_catalog(GatewayConfig{});
  const auto with_image = build_chat_payload(catalog.multimodal, "what is this", "http://img/cat.png", std::nullopt, 256);
  const auto& content = with_image["messages"][0]["content"];
  if (!content.is_array() || content.size() != 2 || content[1]["image_url"]["url"] != "http://img/cat.png" ||
      with_image["model"] != catalog.multimodal.canonical_id || with_image["max_tokens"] != 256) {
    return fail("test_backend_url_split_and_payload_shape", "multimodal image_url payload mismatch");
  }

  const auto with_path = build_chat_payload(catalog.multimodal, "what is this", std::nullopt, "/data/cat.png", 256);
  if (with_path["messages"][0]["content"] != "what is this\n\nimage_path hint: /data/cat.png") {
    return fail("test_backend_url_split_and_payload_shape", "image_path hint mismatch");
  }

  const auto reasoning = build_chat_payload(catalog.reasoning, "why", "http://img/cat.png", std::nullopt, 256);
  if (reasoning["messages"][0]["content"] != "why") {
    return fail("test_backend_url_split_and_payload_shape", "reasoning payload must be plain text");
  }

  if (extract_message_content(nlohmann::json::parse(R"({"choices":[]})")) != "" ||
      extract_message_content(nlohmann::json::parse(R"({"choices":[{"message":{"content":7}}]})")) != "" ||
      extract_message_content(nlohmann::json::parse(R"([1,2])")) != "") {
    return fail("test_backend_url_split_and_payload_shape", "malformed responses must extract empty text");
  }
  return 0;
}

int test_forwarder_invoke_against_fake_backend() {
  FakeBackend backend(reply_with_completion);
  const DispatchForwarder forwarder(ForwarderOptions{.timeout = std::chrono::seconds(5), .max_tokens = 128});

  auto catalog = make_model_catalog(GatewayConfig{});
  catalog.reasoning.backend_endpoint = backend.url();

  const auto result = forwarder.invoke(catalog.reasoning, "derive it", std::nullopt, std::nullopt);
  if (!result.ok || result.text != "42" || result.raw["id"] != "cmpl-1") {
    return fail("test_forwarder_invoke_against_fake_backend", "successful invoke mismatch");
  }

  const auto captured = backend.captured();
  const auto sent = nlohmann::json::parse(captured.body);
  if (captured.path != "/v1/chat/completions" || sent["model"] != catalog.reasoning.canonical_id ||
      sent["max_tokens"] != 128 || sent["messages"][0]["content"] != "derive it") {
    return fail("test_forwarder_invoke_against_fake_backend", "backend received unexpected payload");
  }

  FakeBackend failing([](const httplib::Request&, httplib::Response& response) {
    response.status = 503;
    response.set_content("overloaded", "text/plain");
  });
  catalog.reasoning.backend_endpoint = failing.url();
  const auto failed = forwarder.invoke(catalog.reasoning, "derive it", std::nullopt, std::nullopt);
  if (failed.ok || failed.error != "backend status 503") {
    return fail("test_forwarder_invoke_against_fake_backend", "non-200 backend must produce an error result");
  }

  catalog.reasoning.backend_endpoint = "http://127.0.0.1:1";
  const auto unreachable = forwarder.invoke(catalog.reasoning, "derive it", std::nullopt, std::nullopt);
  if (unreachable.ok || unreachable.error.empty()) {
    return fail("test_forwarder_invoke_against_fake_backend", "transport failure must produce an error result");
  }
  return 0;
}

int test_forwarder_relay_is_verbatim() {
  FakeBackend backend([](const httplib::Request&, httplib::Response& response) {
    response.status = 500;
    response.set_content(R"({"detail":"kv cache exhausted"})", "application/problem+json");
  });
  const DispatchForwarder forwarder;

  const std::string body = R"({"model":"phi-4-reasoning-plus","messages":[],"stream":false})";
  const auto relayed = forwarder.relay(backend.url(), "/v1/completions", "POST", body, std::string("Bearer abc"));
  if (relayed.ok || relayed.status_code != 500 || relayed.body != R"({"detail":"kv cache exhausted"})" ||
      relayed.content_type != "application/problem+json") {
    return fail("test_forwarder_relay_is_verbatim", "upstream error must be relayed verbatim");
  }

  const auto captured = backend.captured();
  if (captured.body != body || captured.path != "/v1/completions" || captured.authorization != "Bearer abc") {
    return fail("test_forwarder_relay_is_verbatim", "request must reach the backend untouched");
  }

  const auto unreachable = forwarder.relay("http://127.0.0.1:1", "/v1/completions", "POST", body, std::nullopt);
  if (unreachable.ok || unreachable.status_code != 502 || !unreachable.body.has_value()) {
    return fail("test_forwarder_relay_is_verbatim", "transport failure must become a 502");
  }
  const auto error = nlohmann::json::parse(*unreachable.body);
  if (error["error"].get<std::string>().rfind("Upstream failure: ", 0) != 0) {
    return fail("test_forwarder_relay_is_verbatim", "502 body must describe the upstream failure");
  }
  return 0;
}

int test_route_endpoint_classifies_and_invokes() {
  FakeBackend backend(reply_with_completion);
  const auto config = config_for(backend.url(), backend.url());
  ScratchDir static_root;
  auto router = make_router(config, static_root.path());

  const auto reply = post(*router, "/route", R"({"text":"  please derive a proof  "})");
  if (reply.status != 200) {
    return fail("test_route_endpoint_classifies_and_invokes", "route should succeed");
  }

  const auto body = nlohmann::json::parse(reply.body);
  if (body["model"] != config.reasoning.model_id || !almost_equal(body["confidence"].get<double>(), 0.88) ||
      body["source"] != "shortcut" || body["dispatch_target"] != config.reasoning.alias ||
      body["dispatch_backend"] != "trtllm-serve" || body["worker_invoked"] != true || body["worker_status"] != "ok") {
    return fail("test_route_endpoint_classifies_and_invokes", "route envelope mismatch");
  }

  const auto& details = body["worker_response"]["details"];
  if (details["target_model"] != config.reasoning.model_id || details["target_alias"] != config.reasoning.alias ||
      details["result"]["text"] != "42" || details["result"]["used_precision"] != "runtime" ||
      details["result"]["raw"]["id"] != "cmpl-1") {
    return fail("test_route_endpoint_classifies_and_invokes", "worker details mismatch");
  }

  const auto& probabilities = body["probabilities"];
  if (!almost_equal(probabilities[config.reasoning.model_id].get<double>() +
                        probabilities[config.multimodal.model_id].get<double>(),
                    1.0) ||
      body["top_k_models"] != nlohmann::json::array({config.reasoning.model_id, config.multimodal.model_id})) {
    return fail("test_route_endpoint_classifies_and_invokes", "probabilities or ranking mismatch");
  }

  const auto sent = nlohmann::json::parse(backend.captured().body);
  if (sent["messages"][0]["content"] != "please derive a proof") {
    return fail("test_route_endpoint_classifies_and_invokes", "text must be trimmed before dispatch");
  }

  const auto photo = nlohmann::json::parse(
      post(*router, "/route", R"({"text":"describe this photo","image_url":"http://img/cat.png"})").body);
  if (photo["model"] != config.multimodal.model_id || !almost_equal(photo["confidence"].get<double>(), 0.99)) {
    return fail("test_route_endpoint_classifies_and_invokes", "image_url must route to multimodal at 0.99");
  }
  const auto sent_photo = nlohmann::json::parse(backend.captured().body);
  if (!sent_photo["messages"][0]["content"].is_array()) {
    return fail("test_route_endpoint_classifies_and_invokes", "image_url must produce multipart content");
  }

  const auto keyword = nlohmann::json::parse(post(*router, "/route", R"({"text":"describe this photo"})").body);
  if (keyword["model"] != config.multimodal.model_id || !almost_equal(keyword["confidence"].get<double>(), 0.85)) {
    return fail("test_route_endpoint_classifies_and_invokes", "photo keyword must route multimodal at 0.85");
  }
  return 0;
}

int test_route_endpoint_input_errors() {
  FakeBackend backend(reply_with_completion);
  ScratchDir static_root;
  auto router = make_router(config_for(backend.url(), backend.url()), static_root.path());

  const auto expect = [&router](const std::string& body, const std::string& error) {
    const auto reply = post(*router, "/route", body);
    return reply.status == 400 && nlohmann::json::parse(reply.body)["error"] == error;
  };

  if (!expect(R"({"text":"   "})", "text is required") || !expect("", "text is required") ||
      !expect(R"({"has_image":true})", "text is required")) {
    return fail("test_route_endpoint_input_errors", "blank text must be rejected");
  }
  if (!expect("{not json", "Invalid JSON payload") || !expect("[1,2,3]", "Invalid JSON payload")) {
    return fail("test_route_endpoint_input_errors", "malformed JSON must be rejected");
  }
  if (backend.captured().count != 0) {
    return fail("test_route_endpoint_input_errors", "rejected requests must not reach a backend");
  }
  return 0;
}

int test_route_endpoint_reports_backend_failure() {
  ScratchDir static_root;
  auto router = make_router(config_for("http://127.0.0.1:1", "http://127.0.0.1:1"), static_root.path());

  const auto reply = post(*router, "/route", R"({"text":"hello"})");
  const auto body = nlohmann::json::parse(reply.body);
  if (reply.status != 200 || body["worker_invoked"] != true ||
      body["worker_status"].get<std::string>().rfind("error: ", 0) != 0 ||
      !body["worker_response"]["details"].contains("error") || body["source"] != "mlp_compat") {
    return fail("test_route_endpoint_reports_backend_failure", "backend failure must be reported in the envelope");
  }
  return 0;
}

int test_tls_backend_is_reported_as_value() {
  const DispatchForwarder forwarder(ForwarderOptions{.timeout = std::chrono::seconds(2), .max_tokens = 16});
  auto catalog = make_model_catalog(GatewayConfig{});
  catalog.reasoning.backend_endpoint = "https://gpu.example:8443";

  const auto invoked = forwarder.invoke(catalog.reasoning, "hello", std::nullopt, std::nullopt);
  if (invoked.ok || invoked.error != "invalid backend url: https://gpu.example:8443") {
    return fail("test_tls_backend_is_reported_as_value", "https invoke must return an error result");
  }

  const auto relayed = forwarder.relay("https://gpu.example:8443", "/v1/chat/completions", "POST", "{}", std::nullopt);
  if (relayed.ok || relayed.status_code != 502 ||
      nlohmann::json::parse(relayed.body.value_or("{}"))["error"] !=
          "Upstream failure: invalid backend url: https://gpu.example:8443") {
    return fail("test_tls_backend_is_reported_as_value", "https relay must become a 502");
  }

  ScratchDir static_root;
  auto router =
      make_router(config_for("https://gpu.example:8443", "https://gpu.example:8444"), static_root.path());

  const auto routed = post(*router, "/route", R"({"text":"hello"})");
  const auto envelope = nlohmann::json::parse(routed.body);
  if (routed.status != 200 || envelope["worker_status"] != "error: invalid backend url: https://gpu.example:8443") {
    return fail("test_tls_backend_is_reported_as_value", "route must report the backend error in the envelope");
  }

  const auto passthrough =
      post(*router, "/v1/chat/completions", R"({"model":"phi-4-reasoning-plus","messages":[]})");
  if (passthrough.status != 502) {
    return fail("test_tls_backend_is_reported_as_value", "passthrough to an https backend must be a 502");
  }
  return 0;
}

int test_passthrough_endpoint() {
  FakeBackend reasoning(reply_with_completion);
  FakeBackend multimodal([](const httplib::Request&, httplib::Response& response) {
    response.status = 422;
    response.set_content("bad request for vision model", "text/plain");
  });
  const auto config = config_for(reasoning.url(), multimodal.url());
  ScratchDir static_root;
  auto router = make_router(config, static_root.path());

  const std::string body = R"({"model":"phi-4-reasoning-plus","messages":[{"role":"user","content":"hi"}]})";
  const auto relayed = post(*router, "/v1/chat/completions", body, std::string("Bearer token-1"));
  if (relayed.status != 200 || nlohmann::json::parse(relayed.body)["id"] != "cmpl-1" ||
      reasoning.captured().body != body || reasoning.captured().authorization != "Bearer token-1") {
    return fail("test_passthrough_endpoint", "alias must relay to the reasoning backend verbatim");
  }

  const auto upstream_error =
      post(*router, "/v1/completions", R"({"model":"nvidia/Phi-4-multimodal-instruct-NVFP4","prompt":"x"})");
  if (upstream_error.status != 422 || upstream_error.body != "bad request for vision model" ||
      upstream_error.content_type != "text/plain" || multimodal.captured().path != "/v1/completions") {
    return fail("test_passthrough_endpoint", "upstream status and body must be relayed");
  }

  const auto unknown = post(*router, "/v1/chat/completions", R"({"model":"gpt-4"})");
  const auto message = nlohmann::json::parse(unknown.body)["error"].get<std::string>();
  for (const auto& name : {config.reasoning.model_id, config.reasoning.alias, config.multimodal.model_id,
                           config.multimodal.alias}) {
    if (unknown.status != 400 || message.find(name) == std::string::npos) {
      return fail("test_passthrough_endpoint", "unknown model must list all accepted names");
    }
  }

  for (const auto* missing : {R"({"messages":[]})", R"({"model":""})", R"({"model":null})"}) {
    const auto reply = post(*router, "/v1/chat/completions", missing);
    if (reply.status != 400 || nlohmann::json::parse(reply.body)["error"] != "Request must include model") {
      return fail("test_passthrough_endpoint", "missing model must be rejected");
    }
  }

  const auto non_string = post(*router, "/v1/chat/completions", R"({"model":5})");
  if (non_string.status != 400 ||
      nlohmann::json::parse(non_string.body)["error"].get<std::string>().rfind("Unknown model", 0) != 0) {
    return fail("test_passthrough_endpoint", "non-string model must be treated as unknown");
  }

  auto down_router = make_router(config_for("http://127.0.0.1:1", "http://127.0.0.1:1"), static_root.path());
  const auto down = post(*down_router, "/v1/chat/completions", R"({"model":"phi-4-reasoning-plus"})");
  if (down.status != 502) {
    return fail("test_passthrough_endpoint", "unreachable backend must yield 502");
  }
  return 0;
}

int test_read_only_endpoints() {
  ScratchDir static_root;
  const auto config = config_for("http://127.0.0.1:1", "http://127.0.0.1:1");
  auto router = make_router(config, static_root.path());

  for (const auto* path : {"/healthz", "/health"}) {
    const auto reply = get(*router, path);
    if (reply.status != 200 || nlohmann::json::parse(reply.body) != nlohmann::json{{"status", "ok"}}) {
      return fail("test_read_only_endpoints", "health endpoints mismatch");
    }
  }

  const auto models = nlohmann::json::parse(get(*router, "/v1/models").body);
  const auto& data = models["data"];
  if (models["object"] != "list" || data.size() != 4 || data[0]["id"] != config.reasoning.model_id ||
      data[0]["owned_by"] != "nvidia" || data[1]["id"] != config.reasoning.alias || data[1]["owned_by"] != "local" ||
      data[2]["id"] != config.multimodal.model_id || data[3]["id"] != config.multimodal.alias ||
      data[3]["object"] != "model") {
    return fail("test_read_only_endpoints", "model listing mismatch");
  }

  const auto snapshot = get(*router, "/telemetry/snapshot");
  const auto telemetry = nlohmann::json::parse(snapshot.body);
  if (snapshot.status != 200 || telemetry["ok"] != true || telemetry["source"] != "local_system" ||
      telemetry["auth_mode"] != "local_only" || !telemetry["ts"].is_number_integer() ||
      !telemetry["cpu_percent"].is_null() || !telemetry.contains("gpu_clock_max_mhz")) {
    return fail("test_read_only_endpoints", "telemetry snapshot mismatch");
  }

  const auto missing = get(*router, "/nope");
  const auto wrong_method = router->handle(GatewayRequest{"DELETE", "/route", "", std::nullopt});
  const auto get_on_post_route = get(*router, "/route");
  for (const auto* reply : {&missing, &wrong_method, &get_on_post_route}) {
    if (reply->status != 404 || nlohmann::json::parse(reply->body)["error"] != "Not Found") {
      return fail("test_read_only_endpoints", "unknown routes must be JSON 404s");
    }
  }
  return 0;
}

int test_static_files_and_traversal() {
  ScratchDir sandbox;
  sandbox.write("ui/index.html", "<html>gateway</html>");
  sandbox.write("ui/js/app.js", "console.log(1);");
  sandbox.write("ui/blob.bin", "\x01\x02");
  sandbox.write("secret.txt", "do not serve");
  std::filesystem::create_directory_symlink(sandbox.path(), sandbox.path() / "ui" / "escape");

  const StaticFiles files(sandbox.path() / "ui");

  const auto index = files.serve("/");
  if (index.status != 200 || index.body != "<html>gateway</html>" || index.content_type != "text/html") {
    return fail("test_static_files_and_traversal", "index mismatch");
  }

  const auto script = files.serve("/static/js/app.js");
  if (script.status != 200 || script.content_type != "text/javascript") {
    return fail("test_static_files_and_traversal", "static asset mismatch");
  }

  if (files.serve("/static/blob.bin").content_type != "application/octet-stream") {
    return fail("test_static_files_and_traversal", "unknown extensions default to octet-stream");
  }

  for (const auto* path : {"/static/../secret.txt", "/static/js/../../secret.txt", "/static/escape/secret.txt",
                           "/static//etc/passwd"}) {
    const auto reply = files.serve(path);
    if (reply.status != 403 || nlohmann::json::parse(reply.body)["error"] != "Forbidden") {
      return fail("test_static_files_and_traversal", "paths outside the root must be forbidden");
    }
  }

  if (files.serve("/static/missing.css").status != 404 || files.serve("/static/js").status != 404 ||
      files.serve("/static/").status != 404) {
    return fail("test_static_files_and_traversal", "missing files and directories must 404");
  }
  return 0;
}

int test_shipped_index_is_served() {
  const GatewayConfig config{};
  auto router = make_router(config, std::filesystem::path(INFER_GATEWAY_SOURCE_DIR) / config.static_dir);

  const auto index = get(*router, "/");
  if (index.status != 200 || index.content_type != "text/html" || index.body.find("/route") == std::string::npos) {
    return fail("test_shipped_index_is_served", "default static root must serve the bundled index page");
  }
  return 0;
}

int test_gateway_server_over_http() {
  FakeBackend backend([](const httplib::Request&, httplib::Response& response) {
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    reply_with_completion(httplib::Request{}, response);
  });
  ScratchDir static_root;
  GatewayServer server(make_router(config_for(backend.url(), backend.url()), static_root.path()));

  const int port = server.bind("127.0.0.1", 0);
  if (port <= 0) {
    return fail("test_gateway_server_over_http", "server failed to bind");
  }
  std::thread listener([&server] { server.listen_after_bind(); });
  server.wait_until_ready();

  httplib::Client client("127.0.0.1", port);
  client.set_read_timeout(std::chrono::seconds(10));

  const auto health = client.Get("/healthz");
  const auto missing = client.Get("/missing");
  const auto bad_json = client.Post("/route", "{", "application/json");

  bool ok = health && health->status == 200 && missing && missing->status == 404 &&
            missing->get_header_value("Content-Type") == "application/json" && bad_json && bad_json->status == 400;

  // Two slow dispatches on separate connections run side by side.
  const auto start = std::chrono::steady_clock::now();
  int completed = 0;
  std::mutex completed_mutex;
  std::vector<std::thread> callers;
  for (int i = 0; i < 2; ++i) {
    callers.emplace_back([port, &completed, &completed_mutex] {
      httplib::Client caller("127.0.0.1", port);
      caller.set_read_timeout(std::chrono::seconds(10));
      const auto reply = caller.Post("/route", R"({"text":"prove it"})", "application/json");
      if (reply && reply->status == 200) {
        const std::lock_guard<std::mutex> lock(completed_mutex);
        ++completed;
      }
    });
  }
  for (auto& caller : callers) {
    caller.join();
  }
  const auto elapsed = std::chrono::steady_clock::now() - start;

  server.stop();
  listener.join();

  if (!ok) {
    return fail("test_gateway_server_over_http", "basic HTTP responses mismatch");
  }
  if (completed != 2 || elapsed >= std::chrono::milliseconds(780)) {
    return fail("test_gateway_server_over_http", "concurrent route calls should overlap");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_config_defaults_and_file_layering(); rc != 0) return rc;
  if (int rc = test_config_rejects_invalid_values(); rc != 0) return rc;
  if (int rc = test_backend_url_split_and_payload_shape(); rc != 0) return rc;
  if (int rc = test_forwarder_invoke_against_fake_backend(); rc != 0) return rc;
  if (int rc = test_forwarder_relay_is_verbatim(); rc != 0) return rc;
  if (int rc = test_route_endpoint_classifies_and_invokes(); rc != 0) return rc;
  if (int rc = test_route_endpoint_input_errors(); rc != 0) return rc;
  if (int rc = test_route_endpoint_reports_backend_failure(); rc != 0) return rc;
  if (int rc = test_tls_backend_is_reported_as_value(); rc != 0) return rc;
  if (int rc = test_passthrough_endpoint(); rc != 0) return rc;
  if (int rc = test_read_only_endpoints(); rc != 0) return rc;
  if (int rc = test_static_files_and_traversal(); rc != 0) return rc;
  if (int rc = test_shipped_index_is_served(); rc != 0) return rc;
  if (int rc = test_gateway_server_over_http(); rc != 0) return rc;

  std::cout << "[PASS] gateway unit tests\n";
  return 0;
}
