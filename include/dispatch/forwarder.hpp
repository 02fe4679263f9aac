#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "model/forward_result.hpp"
#include "model/model_identity.hpp"

namespace infer_gateway::dispatch {

struct BackendUrl {
  // scheme://host[:port]
  std::string origin;
  // Path the backend is mounted under, without a trailing slash; may be empty.
  std::string path_prefix;
};

// Only http:// URLs split; the HTTP client is built without TLS, so any other
// scheme is treated as an invalid backend URL.
std::optional<BackendUrl> split_backend_url(const std::string& url);

struct ForwarderOptions {
  std::chrono::seconds timeout{600};
  int max_tokens{256};
};

// Performs the outbound calls to the inference backends. Upstream failures
// are returned as values; nothing here throws on a network or HTTP error.
class DispatchForwarder {
 public:
  explicit DispatchForwarder(ForwarderOptions options = {});

  // Auto-route call: builds a chat payload for the target and extracts the
  // first choice's message content.
  model::WorkerResult invoke(const model::ModelIdentity& target, const std::string& text,
                             const std::optional<std::string>& image_url,
                             const std::optional<std::string>& image_path) const;

  // Passthrough call: sends the untouched body to backend + path and relays
  // status, content type and body byte-for-byte. A transport failure becomes
  // a 502 with a JSON error body.
  model::ForwardResult relay(const std::string& backend, const std::string& path, const std::string& method,
                             const std::string& body, const std::optional<std::string>& authorization) const;

  [[nodiscard]] const ForwarderOptions& options() const noexcept;

 private:
  ForwarderOptions options_;
};

nlohmann::json build_chat_payload(const model::ModelIdentity& target, const std::string& text,
                                  const std::optional<std::string>& image_url,
                                  const std::optional<std::string>& image_path, int max_tokens);

// choices[0].message.content, or "" when any level is missing or mistyped.
std::string extract_message_content(const nlohmann::json& response);

}  // namespace infer_gateway::dispatch
