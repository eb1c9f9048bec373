/*
  Fragment 6.4 — Seal + Capsule Selftest

  Objective
  ---------
  Framework-free selftest for seal/, pipeline/ and capsule/:
    1) SHA-256 digests and both manifest line styles.
    2) Directory comparison reports the first difference.
    3) Engine run: artifact set with and without --substrate, summary text,
       replay determinism, locale validation.
    4) Matrix artifact heuristic (header / label column / failures).
    5) Invariant gate, each check tripped in isolation (incl. aliasing).
    6) Full capsule over the shipped data/ traces; missing-input exit code;
       exit-code mapping.
    7) Stop at the first failing case (engine error, verdict mismatch) and
       the replay comparison.

  Expected use
  ------------
    ./capsule_selftest
  Non-zero return code indicates failure.
*/

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "engine/capsule/capsule.hpp"
#include "engine/capsule/invariants.hpp"
#include "engine/capsule/matrix_csv.hpp"
#include "engine/core/error.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/observe/trace_generators.hpp"
#include "engine/pipeline/artifacts.hpp"
#include "engine/pipeline/engine_run.hpp"
#include "engine/seal/manifest.hpp"

#ifndef SSSL_DATA_DIR
#define SSSL_DATA_DIR "data"
#endif

namespace sssl {
namespace {

namespace fs = std::filesystem;

using capsule::CaseStage;
using capsule::ExitCode;
using substrate::Verdict;

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

const fs::path& scratch_root() {
  static const fs::path root = [] {
    const fs::path d = fs::temp_directory_path() / "sssl_capsule_selftest";
    ensure_clean_dir(d);
    return d;
  }();
  return root;
}

fs::path data_file(const char* name) {
  return fs::path(SSSL_DATA_DIR) / name;
}

// Substrate run of the SMOKE trace, resealed the way the capsule does it.
fs::path sealed_smoke_run(const std::string& name) {
  pipeline::EngineConfig cfg;
  cfg.in_csv = data_file("sssl_smoke.csv");
  cfg.out_dir = scratch_root() / name;
  cfg.substrate = true;
  ensure_clean_dir(cfg.out_dir);
  (void)pipeline::run_engine(cfg, ExecEnv{});
  (void)seal::seal_directory(cfg.out_dir, seal::ManifestStyle::kText);
  return cfg.out_dir;
}

void test_digests_and_manifests() {
  expect_eq_str(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                "SHA-256: abc");
  expect_eq_str(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
                "SHA-256: empty");

  const fs::path d = scratch_root() / "manifest";
  ensure_clean_dir(d);
  ensure_dir(d / "a");
  write_file(d / "b.txt", "hello\n");
  write_file(d / "a" / "c.txt", "x");

  expect_eq_str(sha256_file(d / "b.txt"), "5891b5b522d5df086d0ff0b110fbd9d21bb4fc7163af34d08286a2e846f6be03",
                "SHA-256: file digest");

  (void)seal::seal_files(d, {"b.txt"}, seal::ManifestStyle::kBinary);
  expect_eq_str(read_file(d / seal::kManifestName),
                "5891b5b522d5df086d0ff0b110fbd9d21bb4fc7163af34d08286a2e846f6be03 *b.txt\n",
                "Manifest: binary style, explicit list");

  (void)seal::seal_directory(d, seal::ManifestStyle::kText);
  expect_eq_str(read_file(d / seal::kManifestName),
                "2d711642b726b04401627ca9fbac32f5c8530fb1903cc4db02258717921a4881  a/c.txt\n"
                "5891b5b522d5df086d0ff0b110fbd9d21bb4fc7163af34d08286a2e846f6be03  b.txt\n",
                "Manifest: text style, recursive, sorted, never lists itself");

  expect_error(ErrorCode::kMissingArtifact,
               [&] { (void)seal::seal_files(d, {"nope.txt"}, seal::ManifestStyle::kBinary); },
               "Manifest: listed file absent -> MissingArtifact");
}

void test_compare_directories() {
  const fs::path a = scratch_root() / "cmp_a";
  const fs::path b = scratch_root() / "cmp_b";
  for (const auto& d : {a, b}) {
    ensure_clean_dir(d);
    write_file(d / "one.csv", "1,2\r\n");
    write_file(d / "two.txt", "same\n");
  }
  expect_true(seal::compare_directories(a, b).equal, "Compare: identical trees");

  write_file(b / "two.txt", "sane\n");
  const auto diff = seal::compare_directories(a, b);
  expect_true(!diff.equal, "Compare: same size, different bytes");
  expect_eq_str(diff.first_difference, "digest differs: two.txt", "Compare: names the differing file");

  write_file(b / "two.txt", "same\n");
  write_file(b / "extra.txt", "");
  const auto extra = seal::compare_directories(a, b);
  expect_true(!extra.equal && extra.first_difference.find("extra.txt") != std::string::npos,
              "Compare: extra file detected");
}

void test_engine_run() {
  pipeline::EngineConfig cfg;
  cfg.in_csv = data_file("sssl_smoke.csv");
  cfg.out_dir = scratch_root() / "engine_plain";
  ensure_clean_dir(cfg.out_dir);

  const auto plain = pipeline::run_engine(cfg, ExecEnv{});
  expect_true(plain.artifacts == std::vector<std::string>{"sssl_states.csv", "summary.txt"},
              "Engine: without substrate only states + summary");
  expect_true(seal::list_regular_files(cfg.out_dir).size() == 2, "Engine: nothing else on disk");
  expect_true(!plain.has_verdict, "Engine: no verdict without substrate");

  expect_eq_str(read_file(cfg.out_dir / pipeline::kSummaryTxt),
                "SSSL Verifier \xE2\x80\x94 summary\n"
                "\n"
                "State space: A4 = {Z0, Eplus, S, Eminus}\n"
                "Conservative extension: phi((m,a,s)) = m\n"
                "\n"
                "Deterministic parameters:\n"
                "tau0=0.05\n"
                "taus=0.7\n"
                "eps=0.02\n"
                "drop=0.15\n"
                "\n"
                "Observations: 25\n"
                "State counts:\n"
                "Z0: 1\n"
                "Eplus: 18\n"
                "S: 5\n"
                "Eminus: 1\n"
                "\n"
                "Rules (deterministic):\n"
                "- Eminus: discharge=1 OR dE/dt <= -drop\n"
                "- S: E_proxy >= taus AND |dE/dt| <= eps\n"
                "- Z0: E_proxy <= tau0 AND |dE/dt| <= eps\n"
                "- Otherwise: Eplus\n",
                "Engine: summary.txt");

  const std::string states = read_file(cfg.out_dir / pipeline::kStatesCsv);
  expect_true(states.rfind("t_s,E_proxy,dE_dt,discharge,a_state\r\n0.000000,0.000000,0.000000,0,Z0\r\n", 0) == 0,
              "Engine: sssl_states.csv header and first row");

  const std::string manifest = read_file(plain.manifest);
  expect_true(manifest.find(" *sssl_states.csv\n") != std::string::npos &&
                  manifest.find(" *summary.txt\n") != std::string::npos,
              "Engine: binary-style manifest lines");

  cfg.substrate = true;
  cfg.out_dir = scratch_root() / "engine_sub_a";
  ensure_clean_dir(cfg.out_dir);
  const auto sub = pipeline::run_engine(cfg, ExecEnv{});
  expect_true(sub.artifacts.size() == 10, "Engine: substrate writes 10 artifacts");
  expect_true(sub.has_verdict && sub.adm.verdict == Verdict::Allow, "Engine: SMOKE verdict ALLOW");

  const std::string eig = read_file(cfg.out_dir / pipeline::kEigenspectrumTxt);
  expect_true(eig.rfind("SSSL spectral artifact (deterministic QR iteration)\n"
                        "Matrix order: [Z0, Eplus, S, Eminus]\n"
                        "Eigenvalues (approx):\n"
                        "0.000000000000\n"
                        "1.000000000000\n"
                        "0.724948128984\n"
                        "0.016228341604\n", 0) == 0,
              "Engine: eigenspectrum.txt eigenvalues");
  expect_true(eig.find("\n\nSpectral radius estimate:\n1.000000000000\n") != std::string::npos,
              "Engine: eigenspectrum.txt radius");

  const std::string collapse = read_file(cfg.out_dir / pipeline::kCollapseCheckCsv);
  expect_true(collapse.rfind("t_s,m,a_state,s,\"phi(m,a,s)\",ok\r\n", 0) == 0, "Engine: collapse_check.csv header");
  expect_true(collapse.find(",0\r\n") == std::string::npos, "Engine: collapse identity holds on every row");

  const fs::path first = cfg.out_dir;
  cfg.out_dir = scratch_root() / "engine_sub_b";
  ensure_clean_dir(cfg.out_dir);
  (void)pipeline::run_engine(cfg, ExecEnv{});
  expect_true(seal::compare_directories(first, cfg.out_dir).equal, "Engine: replay is byte-identical");

  ExecEnv bad_env;
  bad_env.locale = "xx_NOT_A_LOCALE.nope";
  cfg.out_dir = scratch_root() / "engine_bad_locale";
  expect_error(ErrorCode::kInvalidArgument, [&] { (void)pipeline::run_engine(cfg, bad_env); },
               "Engine: unknown locale -> InvalidArgument");
  std::error_code ec;
  expect_true(!fs::exists(cfg.out_dir, ec), "Engine: rejected env writes nothing");

  cfg.in_csv = scratch_root() / "absent.csv";
  expect_error(ErrorCode::kMissingArtifact, [&] { (void)pipeline::run_engine(cfg, ExecEnv{}); },
               "Engine: absent input -> MissingArtifact");
}

void test_matrix_heuristic() {
  const auto labelled = capsule::parse_matrix_rows(
      {{"From\\To", "A", "B"}, {"A", "0.5", "0.5"}, {"B", "1", "0"}}, "labelled");
  expect_true(labelled.size() == 2 && labelled[0][1] == 0.5 && labelled[1][0] == 1.0,
              "Matrix: header row and label column dropped");

  const auto bare = capsule::parse_matrix_rows({{"0.5", "0.5"}, {"1", "0"}}, "bare");
  expect_true(bare.size() == 2 && bare[0][0] == 0.5, "Matrix: all-numeric first row kept");

  const auto header_only = capsule::parse_matrix_rows({{"x", "y"}, {"1", "0"}, {"0", "1"}}, "header_only");
  expect_true(header_only.size() == 2 && header_only[1][1] == 1.0, "Matrix: numeric first column kept");

  const auto p = capsule::read_matrix_csv(sealed_smoke_run("matrix_src") / pipeline::kPMatrixCsv);
  expect_true(p.size() == 4 && p[0][1] == 1.0 && p[2][3] == 0.2, "Matrix: P_matrix.csv read back");

  expect_error(ErrorCode::kData, [] { (void)capsule::parse_matrix_rows({}, "empty"); }, "Matrix: empty -> DataError");
  expect_error(ErrorCode::kData, [] { (void)capsule::parse_matrix_rows({{"1", "0", "0"}, {"0", "1", "0"}}, "wide"); },
               "Matrix: non-square -> DataError");
  expect_error(ErrorCode::kData,
               [] { (void)capsule::parse_matrix_rows({{"h", "i"}, {"1", "x"}, {"0", "1"}}, "cell"); },
               "Matrix: non-numeric body cell -> DataError");
}

void test_invariants() {
  const fs::path good = sealed_smoke_run("inv_good");
  try {
    capsule::require_invariants(good, Verdict::Allow);
    pass("Invariants: SMOKE replay directory passes");
  } catch (const Error& e) {
    fail("Invariants: SMOKE replay directory passes");
    std::cerr << "  got: " << e.what() << "\n";
  }

  expect_error(ErrorCode::kInvariant, [&] { capsule::require_invariants(good, Verdict::Abstain); },
               "Invariants: wrong expected verdict -> InvariantViolation");

  const auto census = capsule::count_states_csv(good / pipeline::kStatesCsv);
  expect_true(census.total() == 25 && census.others.empty(), "Invariants: census of sssl_states.csv");

  const fs::path missing = sealed_smoke_run("inv_missing");
  fs::remove(missing / pipeline::kCollapseCheckCsv);
  expect_error(ErrorCode::kMissingArtifact, [&] { capsule::require_invariants(missing, Verdict::Allow); },
               "Invariants: absent artifact -> MissingArtifact");

  const fs::path no_phi = sealed_smoke_run("inv_no_phi");
  write_file(no_phi / pipeline::kSummaryTxt, "SSSL Verifier\n");
  expect_error(ErrorCode::kInvariant, [&] { capsule::require_invariants(no_phi, Verdict::Allow); },
               "Invariants: summary without phi identity -> InvariantViolation");

  const fs::path bad_token = sealed_smoke_run("inv_token");
  write_file(bad_token / pipeline::kStatesCsv,
             "t_s,E_proxy,dE_dt,discharge,a_state\r\n0.000000,0.000000,0.000000,0,Z0\r\n"
             "1.000000,0.080000,0.080000,0,Q\r\n");
  expect_error(ErrorCode::kInvariant, [&] { capsule::require_invariants(bad_token, Verdict::Allow); },
               "Invariants: non-A4 token -> InvariantViolation");

  const fs::path bad_rho = sealed_smoke_run("inv_rho");
  write_file(bad_rho / pipeline::kPMatrixCsv, "From\\To,Z0,Eplus\r\nZ0,0.5,0.0\r\nEplus,0.0,0.5\r\n");
  expect_error(ErrorCode::kInvariant, [&] { capsule::require_invariants(bad_rho, Verdict::Allow); },
               "Invariants: rho(P) = 0.5 -> InvariantViolation");

  const fs::path ragged = sealed_smoke_run("inv_ragged");
  write_file(ragged / pipeline::kPMatrixCsv, "From\\To,Z0,Eplus\r\nZ0,1.0,0.0\r\n");
  expect_error(ErrorCode::kData, [&] { capsule::require_invariants(ragged, Verdict::Allow); },
               "Invariants: non-square P -> DataError");

  const fs::path aliased = sealed_smoke_run("inv_alias");
  write_file(aliased / pipeline::kTransitionRatiosCsv, read_file(aliased / pipeline::kPMatrixCsv));
  try {
    capsule::require_invariants(aliased, Verdict::Allow);
    fail("Invariants: transition_ratios.csv == P_matrix.csv -> InvariantViolation");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kInvariant &&
                    e.message() == "artifact semantic integrity failed: transition_ratios.csv equals P_matrix.csv",
                "Invariants: transition_ratios.csv == P_matrix.csv -> InvariantViolation");
  }
}

void test_stage_chain_and_exit_codes() {
  int steps = 0;
  for (CaseStage s = CaseStage::kResolveInput; s != CaseStage::kPassed; s = capsule::next_stage(s)) ++steps;
  expect_true(steps == 7, "Stages: ResolveInput..Compare then Passed");
  expect_true(capsule::next_stage(CaseStage::kPassed) == CaseStage::kPassed, "Stages: Passed is terminal");

  expect_true(capsule::exit_code_for(ErrorCode::kMissingArtifact, CaseStage::kResolveInput) == ExitCode::kMissing,
              "Exit: missing input -> 3");
  expect_true(capsule::exit_code_for(ErrorCode::kMissingArtifact, CaseStage::kVerifyB) == ExitCode::kMissing,
              "Exit: missing artifact -> 3");
  expect_true(capsule::exit_code_for(ErrorCode::kInvariant, CaseStage::kVerifyA) == ExitCode::kInvariant,
              "Exit: invariant -> 4");
  expect_true(capsule::exit_code_for(ErrorCode::kReplayMismatch, CaseStage::kCompare) == ExitCode::kInvariant,
              "Exit: replay mismatch -> 4");
  expect_true(capsule::exit_code_for(ErrorCode::kData, CaseStage::kVerifyA) == ExitCode::kInvariant,
              "Exit: data error while verifying -> 4");
  expect_true(capsule::exit_code_for(ErrorCode::kData, CaseStage::kRunA) == ExitCode::kFail,
              "Exit: data error in engine run -> 1");
  expect_true(capsule::exit_code_for(ErrorCode::kValidation, CaseStage::kRunB) == ExitCode::kFail,
              "Exit: validation error in engine run -> 1");
  expect_true(capsule::exit_code_for(ErrorCode::kIoError, CaseStage::kSeal) == ExitCode::kFail,
              "Exit: io error -> 1");

  expect_eq_str(capsule::diagnostic_prefix(ErrorCode::kReplayMismatch, ExitCode::kInvariant), "REPLAY_MISMATCH",
                "Prefix: REPLAY_MISMATCH");
  expect_eq_str(capsule::diagnostic_prefix(ErrorCode::kData, ExitCode::kInvariant), "INVARIANT",
                "Prefix: INVARIANT");
  expect_eq_str(capsule::diagnostic_prefix(ErrorCode::kMissingArtifact, ExitCode::kMissing), "MISSING",
                "Prefix: MISSING");
  expect_eq_str(capsule::diagnostic_prefix(ErrorCode::kValidation, ExitCode::kFail), "FAIL", "Prefix: FAIL");
}

void test_full_capsule() {
  const fs::path root = scratch_root() / "repo";
  ensure_clean_dir(root / "data");
  for (const char* name : {"sssl_smoke.csv", "sssl_mech_vibration.csv", "sssl_fluid_pressure.csv"}) {
    write_file(root / "data" / name, read_file(data_file(name)));
  }

  // Stale output from an earlier run must not survive.
  ensure_dir(root / capsule::kCapsuleDirName / capsule::kOutDirName / "STALE");
  write_file(root / capsule::kCapsuleDirName / capsule::kOutDirName / "STALE" / "old.txt", "old\n");

  capsule::CapsuleConfig cfg;
  cfg.repo_root = root;
  const capsule::CapsuleOutcome out = capsule::run_capsule(cfg);

  expect_true(out.passed && out.exit_code == ExitCode::kPass, "Capsule: core cases PASS");
  if (!out.passed) std::cerr << "  " << out.failed_case << " " << out.message << "\n";

  expect_true(out.cases.size() == 4, "Capsule: four cases ran");
  bool all_passed = true;
  for (const auto& c : out.cases) {
    if (c.stage != CaseStage::kPassed) all_passed = false;
  }
  expect_true(all_passed, "Capsule: every case reached Passed");

  std::error_code ec;
  const fs::path out_dir = root / capsule::kCapsuleDirName / capsule::kOutDirName;
  expect_true(!fs::exists(out_dir / "STALE", ec), "Capsule: OUT purged at start");
  expect_true(fs::exists(root / capsule::kCapsuleDirName / capsule::kWorkDirName / capsule::kNegctlInputName, ec),
              "Capsule: negative control input generated");

  const std::string neg_adm = read_file(out_dir / "NEGCTL_ABSTAIN_REPLAY_A" / pipeline::kAdmResultTxt);
  expect_true(neg_adm.find("adm_E: ABSTAIN\n") != std::string::npos, "Capsule: NEGCTL_ABSTAIN verdict");

  const std::string man = read_file(out_dir / "SMOKE_REPLAY_A" / seal::kManifestName);
  expect_true(man.find("  P_matrix.csv\n") != std::string::npos && man.find(" *") == std::string::npos,
              "Capsule: replay dirs resealed in text style");

  if (out.passed) {
    expect_eq_str(read_file(out.summary_path),
                  "SSSL_VERIFY_CAPSULE\n"
                  "CASES: SMOKE, MECH, FLUID, NEGCTL_ABSTAIN\n"
                  "INVARIANTS:\n"
                  "phi((m,a,s)) = m\n"
                  "A4 = {Z0, Eplus, S, Eminus}\n"
                  "|A4| = 4\n"
                  "rho(P) = 1\n"
                  "B_A = B_B\n"
                  "RESULT: PASS\n",
                  "Capsule: CAPSULE_SUMMARY.txt");
  }
}

void test_capsule_missing_data() {
  const fs::path root = scratch_root() / "repo_no_data";
  ensure_clean_dir(root);

  capsule::CapsuleConfig cfg;
  cfg.repo_root = root;
  const capsule::CapsuleOutcome out = capsule::run_capsule(cfg);

  expect_true(!out.passed, "Capsule: missing data fails");
  expect_true(out.exit_code == ExitCode::kMissing && out.error == ErrorCode::kMissingArtifact,
              "Capsule: missing data -> exit 3");
  expect_true(out.message.find("sssl_smoke.csv") != std::string::npos, "Capsule: message names the file");
  std::error_code ec;
  expect_true(!fs::exists(root / capsule::kCapsuleDirName, ec), "Capsule: nothing written before inputs resolve");
}

// Copy of the shipped inputs under `root`, with `mech_text` standing in for
// the MECH trace.
void stage_repo(const fs::path& root, const std::string& mech_text) {
  ensure_clean_dir(root / "data");
  write_file(root / "data" / "sssl_smoke.csv", read_file(data_file("sssl_smoke.csv")));
  write_file(root / "data" / "sssl_mech_vibration.csv", mech_text);
  write_file(root / "data" / "sssl_fluid_pressure.csv", read_file(data_file("sssl_fluid_pressure.csv")));
}

void test_capsule_stops_at_engine_failure() {
  const fs::path root = scratch_root() / "repo_bad_mech";
  stage_repo(root, "t,E,flag\r\n0,0.1,0\r\n1,0.2,0\r\n");

  capsule::CapsuleConfig cfg;
  cfg.repo_root = root;

  // At the CLI default level the capsule itself writes nothing to stderr;
  // the one diagnostic line is the caller's.
  const LogLevel saved_level = get_log_level();
  set_log_level(LogLevel::WARN);
  std::ostringstream captured;
  std::streambuf* saved_buf = std::cerr.rdbuf(captured.rdbuf());
  const capsule::CapsuleOutcome out = capsule::run_capsule(cfg);
  std::cerr.rdbuf(saved_buf);
  set_log_level(saved_level);

  expect_eq_str(captured.str(), "", "Capsule: failure adds no stderr log line at warn");
  expect_true(!out.passed && out.exit_code == ExitCode::kFail, "Capsule: bad MECH header -> exit 1");
  expect_true(out.error == ErrorCode::kValidation, "Capsule: bad MECH header -> ValidationError");
  expect_eq_str(out.failed_case, "MECH", "Capsule: failing case named");
  expect_true(out.failed_stage == CaseStage::kRunA, "Capsule: fails in RunA");
  expect_eq_str(capsule::diagnostic_prefix(out.error, out.exit_code), "FAIL", "Capsule: engine failure prefix");

  expect_true(out.cases.size() == 2, "Capsule: stops after the failing case");
  expect_true(!out.cases.empty() && out.cases.front().stage == CaseStage::kPassed, "Capsule: SMOKE passed first");

  std::error_code ec;
  const fs::path out_dir = root / capsule::kCapsuleDirName / capsule::kOutDirName;
  expect_true(fs::exists(out_dir / "SMOKE_REPLAY_A", ec), "Capsule: earlier case output kept");
  expect_true(!fs::exists(out_dir / "FLUID_REPLAY_A", ec) && !fs::exists(out_dir / "FLUID_REPLAY_B", ec),
              "Capsule: later cases never start");
  expect_true(!fs::exists(root / capsule::kCapsuleDirName / capsule::kSummaryName, ec),
              "Capsule: no summary on failure");
}

void test_capsule_verdict_mismatch() {
  // MECH expects ALLOW; the alternating trace is ABSTAIN.
  const fs::path root = scratch_root() / "repo_abstain_mech";
  stage_repo(root, observe::render_trace_csv(observe::negative_control_trace(), observe::TraceStyle::kShortestCsv));

  capsule::CapsuleConfig cfg;
  cfg.repo_root = root;
  const capsule::CapsuleOutcome out = capsule::run_capsule(cfg);

  expect_true(!out.passed && out.exit_code == ExitCode::kInvariant, "Capsule: verdict mismatch -> exit 4");
  expect_true(out.error == ErrorCode::kInvariant, "Capsule: verdict mismatch -> InvariantViolation");
  expect_true(out.failed_case == "MECH" && out.failed_stage == CaseStage::kVerifyA, "Capsule: fails in MECH VerifyA");
  expect_eq_str(capsule::diagnostic_prefix(out.error, out.exit_code), "INVARIANT", "Capsule: invariant prefix");
  expect_true(out.message.find("adm_E") != std::string::npos, "Capsule: message names adm_E");
  expect_true(out.cases.size() == 2, "Capsule: verdict mismatch stops the run");
}

void test_replay_match() {
  const fs::path a = sealed_smoke_run("replay_a");
  const fs::path b = sealed_smoke_run("replay_b");
  try {
    capsule::require_replay_match("SMOKE", a, b);
    pass("Replay: identical sealed runs match");
  } catch (const Error& e) {
    fail("Replay: identical sealed runs match");
    std::cerr << "  got: " << e.what() << "\n";
  }

  write_file(b / pipeline::kSummaryTxt, read_file(b / pipeline::kSummaryTxt) + "extra\n");
  try {
    capsule::require_replay_match("SMOKE", a, b);
    fail("Replay: altered replay -> ReplayMismatch");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kReplayMismatch, "Replay: altered replay -> ReplayMismatch");
    expect_true(e.message().find(pipeline::kSummaryTxt) != std::string::npos, "Replay: names the differing file");
    const ExitCode code = capsule::exit_code_for(e.code(), CaseStage::kCompare);
    expect_true(code == ExitCode::kInvariant, "Replay: mismatch at Compare -> exit 4");
    expect_eq_str(capsule::diagnostic_prefix(e.code(), code), "REPLAY_MISMATCH", "Replay: REPLAY_MISMATCH prefix");
  }
}

}  // namespace
}  // namespace sssl

int main() {
  using namespace sssl;

  try {
    test_digests_and_manifests();
    test_compare_directories();
    test_engine_run();
    test_matrix_heuristic();
    test_invariants();
    test_stage_chain_and_exit_codes();
    test_full_capsule();
    test_capsule_missing_data();
    test_capsule_stops_at_engine_failure();
    test_capsule_verdict_mismatch();
    test_replay_match();
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
