/*
  Fragment 7.1 — SSSL Engine CLI (sssl_verify)

  Objective
  ---------
  Command-line front end for one engine run:
    1) Read an observation CSV (t_s,E_proxy,discharge)
    2) Classify every sample into A4 = {Z0, Eplus, S, Eminus}
    3) With --substrate: accumulation, operator table, admissibility,
       transitions, P matrix, eigenspectrum, collapse check
    4) Seal the artifacts into MANIFEST.sha256

  Battery projection mode (--battery_extract) instead writes
  <out_dir>/battery_observations.csv from a battery-cycle table.

  Exit codes
  ----------
    0  => OK
    1  => failure (validation / data / io)
    2  => invalid arguments
    3  => missing input file
    4  => invariant violation

  Usage
  -----
  sssl_verify --in_csv <path> [--out_dir <dir>] [options]
  sssl_verify --battery_extract --battery_csv <path> [--battery_id ID] [--max_rows N] [--out_dir <dir>]
*/

#include <cstdint>
#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "engine/core/error.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/text_format.hpp"
#include "engine/observe/battery_extract.hpp"
#include "engine/pipeline/engine_run.hpp"

namespace sssl {
namespace {

enum class ExitCode : int {
  kOk = 0,
  kFail = 1,
  kArgs = 2,
  kMissing = 3,
  kInvariant = 4,
};

struct Args {
  std::string in_csv;
  std::string out_dir = "outputs";

  ClassifyParams classify;
  bool substrate = false;
  AccumParams accum;
  AdmParams adm;

  bool battery_extract = false;
  std::string battery_csv;
  std::optional<std::string> battery_id;
  std::optional<std::int64_t> max_rows;

  LogLevel log_level = LogLevel::WARN;
};

static void print_usage(std::ostream& os) {
  os <<
    "sssl_verify --in_csv <path> [--out_dir <dir>] [options]\n"
    "sssl_verify --battery_extract --battery_csv <path> [--battery_id ID] [--max_rows N] [--out_dir <dir>]\n"
    "\n"
    "Classification:\n"
    "  --tau0 <x>               (default 0.05)\n"
    "  --taus <x>               (default 0.70)\n"
    "  --eps <x>                (default 0.02)\n"
    "  --drop <x>               (default 0.15)\n"
    "\n"
    "Substrate:\n"
    "  --substrate\n"
    "  --s0 <n>                 (default 0)\n"
    "  --s_max <n>              (default 50)\n"
    "  --inc_on_eminus <n>      (default 1)\n"
    "  --dec_on_s <n>           (default 1)\n"
    "  --collapse_ratio_max <x> (default 0.60)\n"
    "  --churn_ratio_max <x>    (default 0.80)\n"
    "  --require_s <n>          (default 0)\n"
    "\n"
    "Other:\n"
    "  --log_level debug|info|warn|error (default warn)\n";
}

static bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

static bool take_double(int& i, int argc, char** argv, const char* k, double* out, std::string* err) {
  const char* v = nullptr;
  if (!get_next(i, argc, argv, &v)) { *err = std::string(k) + " requires a value"; return false; }
  if (!try_parse_double(v, *out)) { *err = std::string(k) + " must be a finite number"; return false; }
  return true;
}

static bool take_int(int& i, int argc, char** argv, const char* k, std::int64_t* out, std::string* err) {
  const char* v = nullptr;
  if (!get_next(i, argc, argv, &v)) { *err = std::string(k) + " requires a value"; return false; }
  if (!try_parse_int64(v, *out)) { *err = std::string(k) + " must be an integer"; return false; }
  return true;
}

static bool take_string(int& i, int argc, char** argv, const char* k, std::string* out, std::string* err) {
  const char* v = nullptr;
  if (!get_next(i, argc, argv, &v)) { *err = std::string(k) + " requires a value"; return false; }
  *out = v;
  return true;
}

static bool parse_args(int argc, char** argv, Args* a, std::string* err, bool* help_requested) {
  for (int i = 1; i < argc; ++i) {
    const char* k = argv[i];

    if (std::strcmp(k, "--help") == 0 || std::strcmp(k, "-h") == 0) {
      *help_requested = true;
      return true;
    }

    if (std::strcmp(k, "--in_csv") == 0) { if (!take_string(i, argc, argv, k, &a->in_csv, err)) return false; continue; }
    if (std::strcmp(k, "--out_dir") == 0) { if (!take_string(i, argc, argv, k, &a->out_dir, err)) return false; continue; }

    if (std::strcmp(k, "--tau0") == 0) { if (!take_double(i, argc, argv, k, &a->classify.tau0, err)) return false; continue; }
    if (std::strcmp(k, "--taus") == 0) { if (!take_double(i, argc, argv, k, &a->classify.taus, err)) return false; continue; }
    if (std::strcmp(k, "--eps") == 0) { if (!take_double(i, argc, argv, k, &a->classify.eps, err)) return false; continue; }
    if (std::strcmp(k, "--drop") == 0) { if (!take_double(i, argc, argv, k, &a->classify.drop, err)) return false; continue; }

    if (std::strcmp(k, "--substrate") == 0) { a->substrate = true; continue; }
    if (std::strcmp(k, "--s0") == 0) { if (!take_int(i, argc, argv, k, &a->accum.s0, err)) return false; continue; }
    if (std::strcmp(k, "--s_max") == 0) { if (!take_int(i, argc, argv, k, &a->accum.s_max, err)) return false; continue; }
    if (std::strcmp(k, "--inc_on_eminus") == 0) { if (!take_int(i, argc, argv, k, &a->accum.inc_on_eminus, err)) return false; continue; }
    if (std::strcmp(k, "--dec_on_s") == 0) { if (!take_int(i, argc, argv, k, &a->accum.dec_on_s, err)) return false; continue; }

    if (std::strcmp(k, "--collapse_ratio_max") == 0) { if (!take_double(i, argc, argv, k, &a->adm.collapse_ratio_max, err)) return false; continue; }
    if (std::strcmp(k, "--churn_ratio_max") == 0) { if (!take_double(i, argc, argv, k, &a->adm.churn_ratio_max, err)) return false; continue; }
    if (std::strcmp(k, "--require_s") == 0) { if (!take_int(i, argc, argv, k, &a->adm.require_s, err)) return false; continue; }

    if (std::strcmp(k, "--battery_extract") == 0) { a->battery_extract = true; continue; }
    if (std::strcmp(k, "--battery_csv") == 0) { if (!take_string(i, argc, argv, k, &a->battery_csv, err)) return false; continue; }
    if (std::strcmp(k, "--battery_id") == 0) {
      std::string id;
      if (!take_string(i, argc, argv, k, &id, err)) return false;
      a->battery_id = id;
      continue;
    }
    if (std::strcmp(k, "--max_rows") == 0) {
      std::int64_t n = 0;
      if (!take_int(i, argc, argv, k, &n, err)) return false;
      if (n <= 0) { *err = "--max_rows must be positive"; return false; }
      a->max_rows = n;
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

  if (a->out_dir.empty()) { *err = "--out_dir must not be empty"; return false; }
  if (a->battery_extract) {
    if (a->battery_csv.empty()) { *err = "--battery_csv is required with --battery_extract"; return false; }
  } else if (a->in_csv.empty()) {
    *err = "--in_csv is required unless --battery_extract is used";
    return false;
  }
  return true;
}

static ExitCode to_exit_code(ErrorCode c) {
  switch (c) {
    case ErrorCode::kInvalidArgument: return ExitCode::kArgs;
    case ErrorCode::kMissingArtifact: return ExitCode::kMissing;
    case ErrorCode::kInvariant:       return ExitCode::kInvariant;
    default:                          return ExitCode::kFail;
  }
}

static int run_battery(const Args& a) {
  const std::filesystem::path out_dir(a.out_dir);
  ensure_dir(out_dir);
  const std::filesystem::path out_csv = out_dir / "battery_observations.csv";

  observe::BatteryExtractOptions opt;
  opt.battery_id = a.battery_id;
  if (a.max_rows) opt.max_rows = static_cast<std::size_t>(*a.max_rows);

  (void)observe::extract_battery(a.battery_csv, out_csv, opt);

  std::cout << "OK: Battery observations extracted\n";
  std::cout << "OUT_CSV: " << out_csv.string() << "\n";
  return static_cast<int>(ExitCode::kOk);
}

static int run_verify(const Args& a) {
  pipeline::EngineConfig cfg;
  cfg.in_csv = a.in_csv;
  cfg.out_dir = a.out_dir;
  cfg.classify = a.classify;
  cfg.substrate = a.substrate;
  cfg.accum = a.accum;
  cfg.adm = a.adm;

  const pipeline::EngineResult res = pipeline::run_engine(cfg, ExecEnv{});

  std::cout << "OK: SSSL verification complete\n";
  std::cout << "OUT_DIR: " << res.out_dir.string() << "\n";
  std::cout << "MANIFEST: " << res.manifest.string() << "\n";
  return static_cast<int>(ExitCode::kOk);
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
    return static_cast<int>(ExitCode::kArgs);
  }
  if (help) {
    print_usage(std::cout);
    return static_cast<int>(ExitCode::kOk);
  }
  set_log_level(a.log_level);

  try {
    return a.battery_extract ? run_battery(a) : run_verify(a);
  } catch (const Error& e) {
    std::cerr << to_string(e.code()) << ": " << e.message() << "\n";
    return static_cast<int>(to_exit_code(e.code()));
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return static_cast<int>(ExitCode::kFail);
  }
}
