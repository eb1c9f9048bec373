#include "engine/seal/manifest.hpp"

#include "engine/core/error.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace sssl::seal {

namespace fs = std::filesystem;

namespace {

std::uintmax_t file_bytes(const fs::path& p) {
    std::error_code ec;
    const std::uintmax_t n = fs::file_size(p, ec);
    SSSL_ENSURE(!ec, ErrorCode::kIoError, "cannot stat " + p.generic_string() + ": " + ec.message());
    return n;
}

// Every regular file, manifest included; used for replay comparison.
std::vector<std::string> all_regular_files(const fs::path& dir) {
    std::error_code ec;
    SSSL_ENSURE(fs::is_directory(dir, ec), ErrorCode::kMissingArtifact, "directory not found: " + dir.generic_string());

    std::vector<std::string> out;
    fs::recursive_directory_iterator it(dir, ec);
    SSSL_ENSURE(!ec, ErrorCode::kIoError, "cannot list " + dir.generic_string() + ": " + ec.message());
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        SSSL_ENSURE(!ec, ErrorCode::kIoError, "cannot list " + dir.generic_string() + ": " + ec.message());
        if (!it->is_regular_file(ec)) continue;
        out.push_back(it->path().lexically_relative(dir).generic_string());
    }
    SSSL_ENSURE(!ec, ErrorCode::kIoError, "cannot list " + dir.generic_string() + ": " + ec.message());
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

const char* to_string(ManifestStyle s) noexcept {
    switch (s) {
        case ManifestStyle::kBinary: return "binary";
        case ManifestStyle::kText:   return "text";
    }
    return "?";
}

std::vector<std::string> list_regular_files(const fs::path& dir) {
    std::vector<std::string> out = all_regular_files(dir);
    out.erase(std::remove(out.begin(), out.end(), std::string(kManifestName)), out.end());
    return out;
}

Manifest build_manifest(const fs::path& dir, std::vector<std::string> rel_paths, ManifestStyle style) {
    std::sort(rel_paths.begin(), rel_paths.end());
    rel_paths.erase(std::unique(rel_paths.begin(), rel_paths.end()), rel_paths.end());

    Manifest m;
    m.style = style;
    for (const auto& rp : rel_paths) {
        SSSL_ENSURE(rp != kManifestName, ErrorCode::kInvariant, "manifest must not list itself");
        const fs::path p = dir / fs::path(rp);
        ManifestEntry e;
        e.rel_path = rp;
        e.sha256_hex = sha256_file(p);
        e.bytes = file_bytes(p);
        m.entries.push_back(std::move(e));
    }
    return m;
}

std::string render_manifest(const Manifest& m) {
    std::ostringstream os;
    const char* sep = (m.style == ManifestStyle::kBinary) ? " *" : "  ";
    for (const auto& e : m.entries) {
        os << e.sha256_hex << sep << e.rel_path << "\n";
    }
    return os.str();
}

fs::path seal_files(const fs::path& dir, const std::vector<std::string>& rel_paths, ManifestStyle style) {
    const Manifest m = build_manifest(dir, rel_paths, style);
    const fs::path out = dir / kManifestName;
    write_file(out, render_manifest(m));
    log_debug("sealed " + std::to_string(m.entries.size()) + " files (" + to_string(style) + ") in " +
              dir.generic_string());
    return out;
}

fs::path seal_directory(const fs::path& dir, ManifestStyle style) {
    return seal_files(dir, list_regular_files(dir), style);
}

DirComparison compare_directories(const fs::path& a, const fs::path& b) {
    DirComparison r;
    const auto fa = all_regular_files(a);
    const auto fb = all_regular_files(b);

    if (fa != fb) {
        r.equal = false;
        std::vector<std::string> only;
        std::set_symmetric_difference(fa.begin(), fa.end(), fb.begin(), fb.end(), std::back_inserter(only));
        r.first_difference = "file sets differ" + (only.empty() ? std::string{} : ": " + only.front());
        return r;
    }

    for (const auto& rp : fa) {
        const fs::path pa = a / fs::path(rp);
        const fs::path pb = b / fs::path(rp);
        if (file_bytes(pa) != file_bytes(pb)) {
            r.equal = false;
            r.first_difference = "size differs: " + rp;
            return r;
        }
        if (sha256_file(pa) != sha256_file(pb)) {
            r.equal = false;
            r.first_difference = "digest differs: " + rp;
            return r;
        }
    }
    return r;
}

} // namespace sssl::seal
