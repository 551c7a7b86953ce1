#pragma once
#include "mbox_nav/error.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace mn {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Write bytes to `path` (truncating), creating parent directories.
bool write_file(const std::filesystem::path& path, std::string_view bytes, Error* err = nullptr);

// Lowercase hex SHA-256 of a file's contents (OpenSSL); nullopt when the
// file cannot be read.
std::optional<std::string> sha256_file_hex(const std::filesystem::path& p, Error* err = nullptr);

}
