#include "dispatch/forwarder.hpp"

#include <iostream>
#include <utility>

#include <httplib.h>

namespace infer_gateway::dispatch {
namespace {

constexpr const char* kJsonContentType = "application/json";
constexpr const char* kPlainScheme = "http";

httplib::Client make_client(const BackendUrl& url, const std::chrono::seconds timeout) {
  httplib::Client client(url.origin);
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);
  client.set_write_timeout(timeout);
  return client;
}

model::ForwardResult upstream_failure(const std::string& detail) {
  model::ForwardResult result;
  result.ok = false;
  result.status_code = 502;
  result.content_type = kJsonContentType;
  result.body = nlohmann::json{{"error", "Upstream failure: " + detail}}.dump();
  result.error = detail;
  return result;
}

}  // namespace

std::optional<BackendUrl> split_backend_url(const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || url.compare(0, scheme_end, kPlainScheme) != 0) {
    return std::nullopt;
  }

  const auto authority_begin = scheme_end + 3;
  const auto path_begin = url.find('/', authority_begin);
  if (path_begin == authority_begin) {
    return std::nullopt;
  }

  BackendUrl split;
  split.origin = url.substr(0, path_begin);
  if (path_begin != std::string::npos) {
    split.path_prefix = url.substr(path_begin);
    while (!split.path_prefix.empty() && split.path_prefix.back() == '/') {
      split.path_prefix.pop_back();
    }
  }
  if (split.origin.size() <= authority_begin) {
    return std::nullopt;
  }
  return split;
}

nlohmann::json build_chat_payload(const model::ModelIdentity& target, const std::string& text,
                                  const std::optional<std::string>& image_url,
                                  const std::optional<std::string>& image_path, const int max_tokens) {
  const bool multimodal = target.kind == model::model_kind::MULTIMODAL;

  nlohmann::json content;
  if (multimodal && image_url.has_value() && !image_url->empty()) {
    content = nlohmann::json::array({{{"type", "text"}, {"text", text}},
                                     {{"type", "image_url"}, {"image_url", {{"url", *image_url}}}}});
  } else if (multimodal && image_path.has_value() && !image_path->empty()) {
    // No binary upload: the path is passed along as a textual hint.
    content = text + "\n\nimage_path hint: " + *image_path;
  } else {
    content = text;
  }

  return nlohmann::json{{"model", target.canonical_id},
                        {"messages", nlohmann::json::array({{{"role", "user"}, {"content", content}}})},
                        {"max_tokens", max_tokens}};
}

std::string extract_message_content(const nlohmann::json& response) {
  if (!response.is_object()) {
    return {};
  }

  const auto choices = response.find("choices");
  if (choices == response.end() || !choices->is_array() || choices->empty()) {
    return {};
  }

  const auto& choice = choices->front();
  if (!choice.is_object()) {
    return {};
  }

  const auto message = choice.find("message");
  if (message == choice.end() || !message->is_object()) {
    return {};
  }

  const auto content = message->find("content");
  if (content == message->end() || !content->is_string()) {
    return {};
  }
  return content->get<std::string>();
}

DispatchForwarder::DispatchForwarder(ForwarderOptions options) : options_(std::move(options)) {}

model::WorkerResult DispatchForwarder::invoke(const model::ModelIdentity& target, const std::string& text,
                                              const std::optional<std::string>& image_url,
                                              const std::optional<std::string>& image_path) const {
  model::WorkerResult result;

  const auto url = split_backend_url(target.backend_endpoint);
  if (!url.has_value()) {
    result.error = "invalid backend url: " + target.backend_endpoint;
    return result;
  }

  const auto payload = build_chat_payload(target, text, image_url, image_path, options_.max_tokens);
  auto client = make_client(*url, options_.timeout);
  const auto response = client.Post(url->path_prefix + "/v1/chat/completions", payload.dump(), kJsonContentType);
  if (!response) {
    result.error = httplib::to_string(response.error());
    std::cerr << "[dispatch] " << target.canonical_id << " invoke failed: " << result.error << '\n';
    return result;
  }

  if (response->status != 200) {
    result.error = "backend status " + std::to_string(response->status);
    return result;
  }

  try {
    result.raw = nlohmann::json::parse(response->body);
  } catch (const nlohmann::json::parse_error& ex) {
    result.error = std::string("invalid backend response: ") + ex.what();
    return result;
  }

  result.ok = true;
  result.text = extract_message_content(result.raw);
  return result;
}

model::ForwardResult DispatchForwarder::relay(const std::string& backend, const std::string& path,
                                              const std::string& method, const std::string& body,
                                              const std::optional<std::string>& authorization) const {
  const auto url = split_backend_url(backend);
  if (!url.has_value()) {
    return upstream_failure("invalid backend url: " + backend);
  }

  httplib::Request request;
  request.method = method;
  request.path = url->path_prefix + path;
  request.body = body;
  request.set_header("Content-Type", kJsonContentType);
  if (authorization.has_value() && !authorization->empty()) {
    request.set_header("Authorization", *authorization);
  }

  auto client = make_client(*url, options_.timeout);
  const auto response = client.send(request);
  if (!response) {
    const std::string detail = httplib::to_string(response.error());
    std::cerr << "[dispatch] relay to " << backend << path << " failed: " << detail << '\n';
    return upstream_failure(detail);
  }

  model::ForwardResult result;
  result.ok = response->status >= 200 && response->status < 300;
  result.status_code = response->status;
  result.body = response->body;
  result.content_type =
      response->has_header("Content-Type") ? response->get_header_value("Content-Type") : kJsonContentType;
  return result;
}

const ForwarderOptions& DispatchForwarder::options() const noexcept { return options_; }

}  // namespace infer_gateway::dispatch
