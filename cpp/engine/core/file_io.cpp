#include "engine/core/file_io.hpp"

#include "engine/core/error.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace sssl {

namespace fs = std::filesystem;

std::string read_file(const fs::path& path) {
  require_file(path);
  std::ifstream f(path, std::ios::binary);
  SSSL_ENSURE(f.good(), ErrorCode::kIoError, "cannot open: " + path.generic_string());
  std::ostringstream ss;
  ss << f.rdbuf();
  SSSL_ENSURE(!f.bad(), ErrorCode::kIoError, "read failed: " + path.generic_string());
  return ss.str();
}

void write_file(const fs::path& path, std::string_view data) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  SSSL_ENSURE(f.good(), ErrorCode::kIoError, "cannot open for write: " + path.generic_string());
  f.write(data.data(), static_cast<std::streamsize>(data.size()));
  f.flush();
  SSSL_ENSURE(f.good(), ErrorCode::kIoError, "write failed: " + path.generic_string());
}

void require_file(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    SSSL_THROW(ErrorCode::kMissingArtifact, path.generic_string());
  }
}

void ensure_dir(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  SSSL_ENSURE(!ec, ErrorCode::kIoError, "cannot create directory " + dir.generic_string() + ": " + ec.message());
}

void ensure_clean_dir(const fs::path& dir) {
  std::error_code ec;
  if (fs::exists(dir, ec)) {
    fs::remove_all(dir, ec);
    SSSL_ENSURE(!ec, ErrorCode::kIoError, "cannot purge " + dir.generic_string() + ": " + ec.message());
  }
  ensure_dir(dir);
}

} // namespace sssl
