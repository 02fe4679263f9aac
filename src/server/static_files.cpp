#include "server/static_files.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace infer_gateway::server {
namespace {

constexpr const char* kStaticPrefix = "/static/";

struct MimeEntry {
  const char* extension;
  const char* content_type;
};

constexpr std::array<MimeEntry, 16> kMimeTypes{{
    {".html", "text/html"},
    {".htm", "text/html"},
    {".css", "text/css"},
    {".js", "text/javascript"},
    {".mjs", "text/javascript"},
    {".json", "application/json"},
    {".txt", "text/plain"},
    {".svg", "image/svg+xml"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".webp", "image/webp"},
    {".ico", "image/vnd.microsoft.icon"},
    {".woff2", "font/woff2"},
    {".wasm", "application/wasm"},
}};

std::filesystem::path normalize(const std::filesystem::path& path) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  auto canonical = std::filesystem::weakly_canonical(absolute, ec);
  if (ec) {
    return absolute.lexically_normal();
  }
  return canonical;
}

}  // namespace

std::string guess_content_type(const std::filesystem::path& file) {
  std::string extension = file.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

  for (const auto& entry : kMimeTypes) {
    if (extension == entry.extension) {
      return entry.content_type;
    }
  }
  return "application/octet-stream";
}

bool is_within_root(const std::filesystem::path& root, const std::filesystem::path& candidate) {
  const auto normal_root = normalize(root);
  const auto normal_candidate = normalize(candidate);

  auto root_it = normal_root.begin();
  auto candidate_it = normal_candidate.begin();
  for (; root_it != normal_root.end(); ++root_it, ++candidate_it) {
    // A trailing separator shows up as an empty final element.
    if (root_it->empty() && std::next(root_it) == normal_root.end()) {
      break;
    }
    if (candidate_it == normal_candidate.end() || *root_it != *candidate_it) {
      return false;
    }
  }
  return true;
}

StaticFiles::StaticFiles(std::filesystem::path root) : root_(std::move(root)) {}

const std::filesystem::path& StaticFiles::root() const noexcept { return root_; }

HttpReply StaticFiles::serve(const std::string& request_path) const {
  if (request_path == "/") {
    return read_file(root_ / "index.html");
  }

  const std::string prefix{kStaticPrefix};
  if (request_path.rfind(prefix, 0) != 0) {
    return error_reply(404, "Not Found");
  }

  const std::filesystem::path relative{request_path.substr(prefix.size())};
  if (relative.empty()) {
    return error_reply(404, "Not Found");
  }
  if (relative.is_absolute()) {
    return error_reply(403, "Forbidden");
  }

  const auto candidate = root_ / relative;
  if (!is_within_root(root_, candidate)) {
    return error_reply(403, "Forbidden");
  }
  return read_file(candidate);
}

HttpReply StaticFiles::read_file(const std::filesystem::path& file) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    return error_reply(404, "Not Found");
  }

  std::ifstream input(file, std::ios::binary);
  if (!input) {
    return error_reply(404, "Not Found");
  }

  std::string body{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
  if (input.bad()) {
    return error_reply(404, "Not Found");
  }
  return HttpReply{200, guess_content_type(file), std::move(body)};
}

}  // namespace infer_gateway::server
