#pragma once
#include <filesystem>
#include <string_view>

namespace cp {

enum class FileFormat { CSV, JSON, JSONL, Text, Unknown };

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess format from extension (.csv | .json | .jsonl | .ndjson | .txt),
// case-insensitive.
FileFormat detect_format(std::string_view path);

}
