#pragma once
/*
================================================================================
Fragment 1.2 — Core: Error Taxonomy (Hardened, Engine-Wide)
FILE: cpp/engine/core/error.hpp

Purpose:
  - One exception type for the engine, the sealer and the capsule.
  - The ErrorCode is the category. Callers branch on code(), never on what().

Categories:
  - kValidation      malformed header/row, out-of-range field
  - kData            too few rows, unusable matrix artifact
  - kInvariant       collapse identity, A4 tokens, rho(P), admissibility, aliasing
  - kReplayMismatch  REPLAY_A and REPLAY_B differ
  - kMissingArtifact required input or output file absent

Hardening:
  - Every throw records file/line/function for auditability.
  - There is no recovery path: an Error is fatal for the current run.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace sssl {

enum class ErrorCode : int {
  kInvalidArgument = 1,
  kValidation      = 2,
  kData            = 3,
  kInvariant       = 4,
  kReplayMismatch  = 5,
  kMissingArtifact = 6,
  kIoError         = 7,
  kInternal        = 8,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidArgument: return "InvalidArgument";
    case ErrorCode::kValidation:      return "ValidationError";
    case ErrorCode::kData:            return "DataError";
    case ErrorCode::kInvariant:       return "InvariantViolation";
    case ErrorCode::kReplayMismatch:  return "ReplayMismatch";
    case ErrorCode::kMissingArtifact: return "MissingArtifact";
    case ErrorCode::kIoError:         return "IoError";
    case ErrorCode::kInternal:        return "Internal";
    default:                          return "Unknown";
  }
}

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code,
        std::string message,
        const char* file,
        int line,
        const char* function)
      : std::runtime_error(build_what(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        file_(file ? file : ""),
        function_(function ? function : ""),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const std::string& file() const noexcept { return file_; }
  const std::string& function() const noexcept { return function_; }
  int line() const noexcept { return line_; }

 private:
  static std::string build_what(ErrorCode code,
                                const std::string& msg,
                                const char* file,
                                int line,
                                const char* func) {
    std::ostringstream oss;
    oss << "[sssl::Error " << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << msg;
    if (file && *file) {
      oss << " @ " << file << ":" << line;
      if (func && *func) oss << " (" << func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  std::string file_;
  std::string function_;
  int line_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                    std::string message,
                                    const char* file,
                                    int line,
                                    const char* function) {
  throw Error(code, std::move(message), file, line, function);
}

inline void ensure(bool ok,
                   ErrorCode code,
                   std::string message,
                   const char* file,
                   int line,
                   const char* function) {
  if (!ok) {
    throw_error(code, std::move(message), file, line, function);
  }
}

}  // namespace sssl

#define SSSL_THROW(CODE, MSG) ::sssl::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define SSSL_ENSURE(EXPR, CODE, MSG) ::sssl::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)
