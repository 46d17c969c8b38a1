#include "chatpack/path_utils.hpp"
#include <cctype>
#include <string>
#include <system_error>

namespace cp {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

FileFormat detect_format(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (ext == ".csv") return FileFormat::CSV;
  if (ext == ".json") return FileFormat::JSON;
  if (ext == ".jsonl" || ext == ".ndjson") return FileFormat::JSONL;
  if (ext == ".txt") return FileFormat::Text;
  return FileFormat::Unknown;
}

}
