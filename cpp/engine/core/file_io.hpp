#pragma once
/*
================================================================================
Fragment 1.7 — Core: File + Directory Helpers
FILE: cpp/engine/core/file_io.hpp

  - Whole-file binary read/write (no newline translation).
  - Purge-then-create for run directories so no stale file can leak into a
    manifest or a replay comparison.
  - All failures surface as sssl::Error (kMissingArtifact / kIoError).
================================================================================
*/

#include <filesystem>
#include <string>
#include <string_view>

namespace sssl {

std::string read_file(const std::filesystem::path& path);

void write_file(const std::filesystem::path& path, std::string_view data);

void require_file(const std::filesystem::path& path);

void ensure_dir(const std::filesystem::path& dir);

// Removes dir (recursively) if present, then recreates it empty.
void ensure_clean_dir(const std::filesystem::path& dir);

} // namespace sssl
