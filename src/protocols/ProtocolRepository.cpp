/* @file ProtocolRepository.cpp
 * @brief JSON protocol files on the host FS.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "core/Errors.hpp"
#include "protocols/ProtocolRepository.hpp"

using namespace ivlab::protocols;
namespace fs = std::filesystem;

namespace {
  constexpr const char* kExtension = ".json";
}

FileProtocolRepository::FileProtocolRepository(std::string rootDir) : root_(std::move(rootDir)) {}

std::vector<std::string> FileProtocolRepository::list() const {
  std::vector<std::string> ids;
  std::error_code ec;
  if (!fs::is_directory(root_, ec))
    return ids;

  for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec) || it->path().extension() != kExtension)
      continue;
    auto rel = fs::relative(it->path(), root_, ec);
    if (ec)
      break;
    rel.replace_extension();
    ids.push_back(rel.generic_string());
  }
  if (ec)
    throw std::runtime_error("[ProtocolRepository] cannot scan " + root_ + ": " + ec.message());
  std::sort(ids.begin(), ids.end());
  return ids;
}

nlohmann::json FileProtocolRepository::load(const std::string& id) const {
  if (id.empty() || id.find("..") != std::string::npos || id.front() == '/')
    throw ivlab::core::NotFoundError("[ProtocolRepository] invalid protocol id: " + id);

  const auto path = fs::path(root_) / (id + kExtension);
  std::ifstream in(path);
  if (!in)
    throw ivlab::core::NotFoundError("[ProtocolRepository] protocol not found: " + id);
  try {
    return nlohmann::json::parse(in, nullptr, true, /*ignore_comments=*/true);
  } catch (const nlohmann::json::parse_error& e) {
    throw ivlab::core::ValidationError("[ProtocolRepository] " + path.string() + ": " + e.what());
  }
}
