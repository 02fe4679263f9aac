#pragma once

#include <filesystem>
#include <string>

#include "server/handlers.hpp"

namespace infer_gateway::server {

// Serves files below a single root directory. "/" maps to index.html and
// "/static/<rel>" to <root>/<rel>.
class StaticFiles {
 public:
  explicit StaticFiles(std::filesystem::path root);

  HttpReply serve(const std::string& request_path) const;

  [[nodiscard]] const std::filesystem::path& root() const noexcept;

 private:
  HttpReply read_file(const std::filesystem::path& file) const;

  std::filesystem::path root_;
};

std::string guess_content_type(const std::filesystem::path& file);

// True when candidate, after normalization, is root itself or lies below it.
bool is_within_root(const std::filesystem::path& root, const std::filesystem::path& candidate);

}  // namespace infer_gateway::server
