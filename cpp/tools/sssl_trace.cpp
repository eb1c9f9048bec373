/*
  Fragment 7.3 — Deterministic Trace Generator (sssl_trace)

  Objective
  ---------
  Regenerate the fixed observation traces under data/ from the repository
  itself. Same arguments => same bytes.

  Traces
  ------
    smoke   ramp / plateau / discharge drop / ramp (25 samples)
    mech    vibration envelope, default n=60 dt=0.1
    fluid   pressure envelope, default n=70 dt=0.1
    negctl  alternating negative control, default n=400

  Exit codes
  ----------
    0  => written
    1  => io error
    2  => invalid arguments

  Usage
  -----
  sssl_trace <smoke|mech|fluid|negctl> --out_csv <path> [--n N] [--dt X]
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
#include "engine/core/text_format.hpp"
#include "engine/observe/trace_generators.hpp"

namespace sssl {
namespace {

enum class ExitCode : int {
  kOk = 0,
  kError = 1,
  kArgs = 2,
};

struct Args {
  std::string trace;
  std::string out_csv;
  std::optional<std::int64_t> n;
  std::optional<double> dt;
};

static void print_usage(std::ostream& os) {
  os <<
    "sssl_trace <smoke|mech|fluid|negctl> --out_csv <path> [--n N] [--dt X]\n"
    "\n"
    "  --n N     sample count (mech, fluid, negctl)\n"
    "  --dt X    time step (mech, fluid)\n";
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

    if (std::strcmp(k, "--out_csv") == 0) {
      const char* v = nullptr;
      if (!get_next(i, argc, argv, &v)) { *err = "--out_csv requires a value"; return false; }
      a->out_csv = v;
      continue;
    }

    if (std::strcmp(k, "--n") == 0) {
      const char* v = nullptr;
      std::int64_t n = 0;
      if (!get_next(i, argc, argv, &v)) { *err = "--n requires a value"; return false; }
      if (!try_parse_int64(v, n) || n <= 0) { *err = "--n must be a positive integer"; return false; }
      a->n = n;
      continue;
    }

    if (std::strcmp(k, "--dt") == 0) {
      const char* v = nullptr;
      double dt = 0.0;
      if (!get_next(i, argc, argv, &v)) { *err = "--dt requires a value"; return false; }
      if (!try_parse_double(v, dt) || dt <= 0.0) { *err = "--dt must be a positive number"; return false; }
      a->dt = dt;
      continue;
    }

    if (k[0] != '-' && a->trace.empty()) {
      a->trace = k;
      continue;
    }

    *err = std::string("Unknown argument: ") + k;
    return false;
  }

  if (a->trace != "smoke" && a->trace != "mech" && a->trace != "fluid" && a->trace != "negctl") {
    *err = "trace must be one of smoke|mech|fluid|negctl";
    return false;
  }
  if (a->out_csv.empty()) { *err = "Missing --out_csv"; return false; }
  return true;
}

static void generate(const Args& a) {
  using namespace observe;
  const std::filesystem::path out(a.out_csv);
  if (out.has_parent_path()) ensure_dir(out.parent_path());

  if (a.trace == "smoke") {
    write_trace_csv(out, smoke_trace(), TraceStyle::kGeneral12Csv);
  } else if (a.trace == "mech") {
    write_trace_csv(out, mech_vibration_trace(a.n ? static_cast<std::size_t>(*a.n) : 60, a.dt.value_or(0.1)),
                    TraceStyle::kShortestCsv);
  } else if (a.trace == "fluid") {
    write_trace_csv(out, fluid_pressure_trace(a.n ? static_cast<std::size_t>(*a.n) : 70, a.dt.value_or(0.1)),
                    TraceStyle::kShortestCsv);
  } else {
    write_trace_csv(out, negative_control_trace(a.n ? static_cast<std::size_t>(*a.n) : kNegativeControlSamples),
                    TraceStyle::kPlainLf);
  }
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

  try {
    generate(a);
  } catch (const Error& e) {
    std::cerr << to_string(e.code()) << ": " << e.message() << "\n";
    return static_cast<int>(ExitCode::kError);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return static_cast<int>(ExitCode::kError);
  }

  std::cout << "OK: trace written\n";
  std::cout << "OUT_CSV: " << a.out_csv << "\n";
  return static_cast<int>(ExitCode::kOk);
}
