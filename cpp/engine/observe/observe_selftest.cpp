/*
  Fragment 3.4 — Observation Layer Selftest

  Objective
  ---------
  Framework-free selftest for the observe/ layer:
    1) Header must be exactly t_s,E_proxy,discharge; bad input writes nothing.
    2) Row validation (E_proxy >= 0, discharge in {0,1}, field count) and the
       two-row minimum, each with its error category.
    3) Stable (t_s, E_proxy, discharge) ordering and the dt == 0 derivative.
    4) Battery projection (column lookup, id selection, max_rows, output bytes).
    5) Trace generators reproduce the shipped data/ traces byte-for-byte.

  Expected use
  ------------
    ./observe_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "engine/core/error.hpp"
#include "engine/core/file_io.hpp"
#include "engine/observe/battery_extract.hpp"
#include "engine/observe/observation.hpp"
#include "engine/observe/trace_generators.hpp"
#include "engine/pipeline/engine_run.hpp"

#ifndef SSSL_DATA_DIR
#define SSSL_DATA_DIR "data"
#endif

namespace sssl {
namespace {

namespace fs = std::filesystem;

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

template <class Fn>
void expect_error(ErrorCode want, Fn&& fn, std::string_view msg) {
  try {
    fn();
    fail(msg);
    std::cerr << "  no error raised\n";
  } catch (const Error& e) {
    if (e.code() == want) {
      pass(msg);
    } else {
      fail(msg);
      std::cerr << "  got: " << e.what() << "\n";
    }
  }
}

std::vector<observe::Observation> parse_text(const std::string& text) {
  std::istringstream in(text);
  return observe::parse_observations_csv(in, "inline");
}

fs::path scratch_dir() {
  const fs::path d = fs::temp_directory_path() / "sssl_observe_selftest";
  ensure_clean_dir(d);
  return d;
}

void test_header_rejected_without_artifacts() {
  const fs::path root = scratch_dir();
  const fs::path in_csv = root / "bad_header.csv";
  write_file(in_csv, "t,E,flag\n0,0.1,0\n1,0.2,0\n");

  pipeline::EngineConfig cfg;
  cfg.in_csv = in_csv;
  cfg.out_dir = root / "out";
  cfg.substrate = true;

  expect_error(ErrorCode::kValidation, [&] { (void)pipeline::run_engine(cfg, ExecEnv{}); },
               "Engine: header t,E,flag -> ValidationError");
  std::error_code ec;
  expect_true(!fs::exists(cfg.out_dir, ec), "Engine: rejected input leaves no output directory");

  expect_error(ErrorCode::kValidation, [] { (void)parse_text("t_s,E_proxy\n0,1\n1,2\n"); },
               "Ingest: missing column -> ValidationError");
  expect_error(ErrorCode::kValidation, [] { (void)parse_text("t_s, E_proxy,discharge\n0,1,0\n1,2,0\n"); },
               "Ingest: header whitespace -> ValidationError");
  expect_error(ErrorCode::kValidation, [] { (void)parse_text(""); },
               "Ingest: empty input -> ValidationError");
}

void test_row_validation() {
  expect_error(ErrorCode::kValidation, [] { (void)parse_text("t_s,E_proxy,discharge\n0,-0.1,0\n1,0.2,0\n"); },
               "Ingest: negative E_proxy -> ValidationError");
  expect_error(ErrorCode::kValidation, [] { (void)parse_text("t_s,E_proxy,discharge\n0,0.1,2\n1,0.2,0\n"); },
               "Ingest: discharge=2 -> ValidationError");
  expect_error(ErrorCode::kValidation, [] { (void)parse_text("t_s,E_proxy,discharge\n0,abc,0\n1,0.2,0\n"); },
               "Ingest: non-numeric E_proxy -> ValidationError");
  expect_error(ErrorCode::kValidation, [] { (void)parse_text("t_s,E_proxy,discharge\n0,0.1,0,9\n1,0.2,0\n"); },
               "Ingest: extra field -> ValidationError");
  expect_error(ErrorCode::kData, [] { (void)parse_text("t_s,E_proxy,discharge\n0,0.1,0\n"); },
               "Ingest: single row -> DataError");
  expect_error(ErrorCode::kMissingArtifact,
               [] { (void)observe::read_observations(fs::temp_directory_path() / "sssl_no_such_input.csv"); },
               "Ingest: absent file -> MissingArtifact");

  try {
    (void)parse_text("t_s,E_proxy,discharge\n0,0.1,0\n1,0.2,7\n");
    fail("Ingest: error message names the line");
  } catch (const Error& e) {
    expect_true(e.message().find("line 3") != std::string::npos, "Ingest: error message names the line");
  }
}

void test_ordering_and_derivative() {
  const auto rows = parse_text(
      "t_s,E_proxy,discharge\r\n"
      "1,0.5,0\r\n"
      "\r\n"
      "0,0.2,1\r\n"
      "1,0.3,1\r\n"
      "1,0.3,0\r\n");

  expect_true(rows.size() == 4, "Ingest: blank lines skipped, CRLF accepted");
  expect_true(rows[0].t_s == 0.0 && rows[0].e_proxy == 0.2, "Order: smallest t_s first");
  expect_true(rows[1].t_s == 1.0 && rows[1].e_proxy == 0.3 && rows[1].discharge == 0,
              "Order: tie on t_s broken by E_proxy then discharge");
  expect_true(rows[2].e_proxy == 0.3 && rows[2].discharge == 1, "Order: discharge ascending on full tie");
  expect_true(rows[3].e_proxy == 0.5, "Order: larger E_proxy last");

  const auto d = observe::compute_dedt(rows);
  expect_true(d.size() == rows.size(), "dE/dt aligned 1:1");
  expect_true(d[0] == 0.0, "dE/dt: first sample is 0");
  expect_true(std::fabs(d[1] - 0.1) < 1e-12, "dE/dt: (0.3-0.2)/1");
  expect_true(d[2] == 0.0 && d[3] == 0.0, "dE/dt: dt == 0 gives 0");
}

void test_battery_projection() {
  const fs::path root = scratch_dir();
  const fs::path in_csv = root / "battery.csv";
  write_file(in_csv,
             "cycle,battery_id,disV,disI,note\n"
             "2,B5,3.5,-1.0,x\n"
             "1,B5,3.9,0.5,y\n"
             "1,B6,4.0,-2.0,z\n"
             "3,B5,3.2,-0.5,w\n");

  const fs::path out_all = root / "all.csv";
  const auto r1 = observe::extract_battery(in_csv, out_all, {});
  expect_eq_str(r1.battery_id, "B5", "Battery: first id seen is chosen");
  expect_true(r1.rows == 3, "Battery: all rows of chosen id");
  expect_eq_str(read_file(out_all),
                "t_s,E_proxy,discharge\r\n"
                "1.000000,3.900000,0\r\n"
                "2.000000,3.500000,1\r\n"
                "3.000000,3.200000,1\r\n",
                "Battery: sorted projection, disI < 0 -> discharge");

  observe::BatteryExtractOptions opt;
  opt.max_rows = 2;
  const fs::path out_cap = root / "cap.csv";
  const auto r2 = observe::extract_battery(in_csv, out_cap, opt);
  expect_true(r2.rows == 2, "Battery: max_rows stops the scan");
  expect_eq_str(read_file(out_cap),
                "t_s,E_proxy,discharge\r\n"
                "1.000000,3.900000,0\r\n"
                "2.000000,3.500000,1\r\n",
                "Battery: max_rows keeps the first rows in file order");

  observe::BatteryExtractOptions pick;
  pick.battery_id = "B6";
  const auto r3 = observe::extract_battery(in_csv, root / "b6.csv", pick);
  expect_true(r3.rows == 1 && r3.battery_id == "B6", "Battery: explicit id");

  const fs::path bad = root / "bad.csv";
  write_file(bad, "cycle,disV,disI\n1,3.0,-1\n");
  expect_error(ErrorCode::kValidation, [&] { (void)observe::extract_battery(bad, root / "x.csv", {}); },
               "Battery: missing battery_id column -> ValidationError");
}

void test_trace_generators() {
  const fs::path data(SSSL_DATA_DIR);

  const auto smoke = observe::smoke_trace();
  expect_true(smoke.size() == 25, "Trace: smoke has 25 samples");
  expect_true(smoke[16].discharge == 1, "Trace: smoke discharge at sample 16");
  expect_eq_str(observe::render_trace_csv(smoke, observe::TraceStyle::kGeneral12Csv),
                read_file(data / "sssl_smoke.csv"), "Trace: smoke matches data/sssl_smoke.csv");

  expect_eq_str(observe::render_trace_csv(observe::mech_vibration_trace(), observe::TraceStyle::kShortestCsv),
                read_file(data / "sssl_mech_vibration.csv"),
                "Trace: mech matches data/sssl_mech_vibration.csv");
  expect_eq_str(observe::render_trace_csv(observe::fluid_pressure_trace(), observe::TraceStyle::kShortestCsv),
                read_file(data / "sssl_fluid_pressure.csv"),
                "Trace: fluid matches data/sssl_fluid_pressure.csv");

  const auto neg = observe::negative_control_trace();
  expect_true(neg.size() == observe::kNegativeControlSamples, "Trace: negative control size");
  const std::string neg_text = observe::render_trace_csv(neg, observe::TraceStyle::kPlainLf);
  expect_true(neg_text.rfind("t_s,E_proxy,discharge\n0,1.0,1\n1,0.0,0\n2,1.0,0\n3,0.0,1\n", 0) == 0,
              "Trace: negative control rows");
  expect_true(observe::mech_vibration_trace(3).size() == 10, "Trace: n raised to 10");
}

}  // namespace
}  // namespace sssl

int main() {
  using namespace sssl;

  try {
    test_header_rejected_without_artifacts();
    test_row_validation();
    test_ordering_and_derivative();
    test_battery_projection();
    test_trace_generators();
  } catch (const std::exception& e) {
    fail(std::string("unexpected exception: ") + e.what());
  }

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
