/*
  Fragment 7.2 — SSSL Verification Capsule CLI (sssl_capsule)

  Objective
  ---------
  Run the core cases (SMOKE, MECH, FLUID, NEGCTL_ABSTAIN) twice each,
  reseal both replay directories, enforce the per-directory invariants and
  require byte-identical replays. Stops at the first failure.

  Output
  ------
  stdout ends with "CAPSULE_RESULT: PASS" or "CAPSULE_RESULT: FAIL".
  On failure stderr carries one line prefixed MISSING: / INVARIANT: /
  REPLAY_MISMATCH: / FAIL:.

  Exit codes
  ----------
    0  => PASS
    1  => engine run failure or other error
    2  => invalid arguments
    3  => missing artifact
    4  => invariant violation / replay mismatch / unusable matrix artifact

  Usage
  -----
  sssl_capsule [--repo_root <dir>] [--cases core] [--log_level debug|info|warn|error]
*/

#include <cstring>
#include <iostream>
#include <string>

#include "engine/capsule/capsule.hpp"
#include "engine/core/logging.hpp"

namespace sssl {
namespace {

struct Args {
  std::string repo_root = "..";
  std::string cases = "core";
  LogLevel log_level = LogLevel::WARN;
};

static void print_usage(std::ostream& os) {
  os <<
    "sssl_capsule [--repo_root <dir>] [--cases core] [--log_level <level>]\n"
    "\n"
    "Options:\n"
    "  --repo_root <dir>   Repository root holding data/ (default ..)\n"
    "  --cases core        Case set (only 'core')\n"
    "  --log_level <lvl>   debug|info|warn|error (default warn)\n";
}

static bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

static bool parse_args(int argc, char** argv, Args* a, std::string* err, bool* help_requested) {
  for (int i = 1; i < argc; ++i) {
    const char* k = argv[i];

    if (std::strcmp(k, "--help") == 0 || std::strcmp(k, "-h") == 0) {
      *help_requested = true;
      return true;
    }

    if (std::strcmp(k, "--repo_root") == 0) {
      const char* v = nullptr;
      if (!get_next(i, argc, argv, &v)) { *err = "--repo_root requires a value"; return false; }
      a->repo_root = v;
      continue;
    }

    if (std::strcmp(k, "--cases") == 0) {
      const char* v = nullptr;
      if (!get_next(i, argc, argv, &v)) { *err = "--cases requires a value"; return false; }
      if (std::strcmp(v, "core") != 0) { *err = std::string("--cases must be 'core' (got '") + v + "')"; return false; }
      a->cases = v;
      continue;
    }

    if (std::strcmp(k, "--log_level") == 0) {
      const char* v = nullptr;
      if (!get_next(i, argc, argv, &v)) { *err = "--log_level requires a value"; return false; }
      if (!parse_log_level(v, &a->log_level)) { *err = "--log_level must be debug|info|warn|error"; return false; }
      continue;
    }

    *err = std::string("Unknown argument: ") + k;
    return false;
  }

  if (a->repo_root.empty()) { *err = "--repo_root must not be empty"; return false; }
  return true;
}

}  // namespace
}  // namespace sssl

int main(int argc, char** argv) {
  using namespace sssl;

  Args a{};
  std::string arg_err;
  bool help = false;
  if (!parse_args(argc, argv, &a, &arg_err, &help)) {
    std::cerr << "Argument error: " << arg_err << "\n\n";
    print_usage(std::cerr);
    std::cout << "CAPSULE_RESULT: FAIL\n";
    return static_cast<int>(capsule::ExitCode::kArgs);
  }
  if (help) {
    print_usage(std::cout);
    return static_cast<int>(capsule::ExitCode::kPass);
  }
  set_log_level(a.log_level);

  capsule::CapsuleConfig cfg;
  cfg.repo_root = a.repo_root;
  cfg.cases = a.cases;

  const capsule::CapsuleOutcome out = capsule::run_capsule(cfg);
  if (out.passed) {
    std::cout << "CAPSULE_RESULT: PASS\n";
    return static_cast<int>(capsule::ExitCode::kPass);
  }

  std::cerr << capsule::diagnostic_prefix(out.error, out.exit_code) << ": ";
  if (!out.failed_case.empty()) {
    std::cerr << out.failed_case << " [" << capsule::to_string(out.failed_stage) << "] ";
  }
  std::cerr << out.message << "\n";
  std::cout << "CAPSULE_RESULT: FAIL\n";
  return static_cast<int>(out.exit_code);
}
