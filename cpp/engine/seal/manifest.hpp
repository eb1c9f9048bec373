// ============================================================================
// Fragment 4.1 — Artifact Sealer (MANIFEST.sha256) + Replay Directory Compare
// File: cpp/engine/seal/manifest.hpp
// ============================================================================
//
// Purpose:
// - Seal a run directory: one "<sha256> <marker><relpath>" line per file,
//   sorted by the '/'-separated relative path, '\n'-terminated.
// - Compare two sealed directories byte-for-byte (paths, sizes, digests).
//
// Line styles (both produced in this repo):
// - ManifestStyle::kBinary : "<hex> *<relpath>"  (engine seal; hashes the
//                            explicit artifact list the engine wrote)
// - ManifestStyle::kText   : "<hex>  <relpath>"  (capsule reseal; hashes
//                            every regular file under the directory)
//
// Rules:
// - The manifest never lists itself.
// - The manifest is written last; nothing may be added to the directory
//   after sealing.
// ============================================================================

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sssl::seal {

inline constexpr const char* kManifestName = "MANIFEST.sha256";

enum class ManifestStyle : std::uint8_t {
    kBinary = 0,
    kText = 1
};

const char* to_string(ManifestStyle s) noexcept;

struct ManifestEntry final {
    std::string rel_path;     // '/'-separated
    std::string sha256_hex;
    std::uintmax_t bytes = 0;
};

struct Manifest final {
    ManifestStyle style = ManifestStyle::kBinary;
    std::vector<ManifestEntry> entries;  // sorted by rel_path
};

// Every regular file under dir (recursive), manifest excluded, sorted.
std::vector<std::string> list_regular_files(const std::filesystem::path& dir);

// Hash the given relative paths (must exist; kMissingArtifact otherwise).
Manifest build_manifest(const std::filesystem::path& dir,
                        std::vector<std::string> rel_paths,
                        ManifestStyle style);

std::string render_manifest(const Manifest& m);

// Engine seal: explicit list. Returns the manifest path.
std::filesystem::path seal_files(const std::filesystem::path& dir,
                                 const std::vector<std::string>& rel_paths,
                                 ManifestStyle style);

// Capsule reseal: every file currently in dir. Returns the manifest path.
std::filesystem::path seal_directory(const std::filesystem::path& dir, ManifestStyle style);

struct DirComparison final {
    bool equal = true;
    std::string first_difference;  // empty when equal
};

DirComparison compare_directories(const std::filesystem::path& a, const std::filesystem::path& b);

} // namespace sssl::seal
