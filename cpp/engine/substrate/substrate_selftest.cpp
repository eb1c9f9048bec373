/*
  Fragment 2.6 — Substrate Selftest

  Objective
  ---------
  Framework-free selftest for the substrate/ layer:
    1) Classifier priority chain and threshold edges.
    2) Accumulator bounds, reset and parameter validation.
    3) Operator algebra: the full 16-row table.
    4) Transition counts, row-normalised P, zero rows, no wraparound.
    5) Spectral procedures: power iteration on random row-stochastic
       matrices, zero matrix, non-square input, QR eigenvalues of SMOKE's P.
    6) Admissibility on the shipped traces and the negative control.

  Expected use
  ------------
    ./substrate_selftest
  Non-zero return code indicates failure.
*/

#include <array>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/error.hpp"
#include "engine/core/text_format.hpp"
#include "engine/observe/observation.hpp"
#include "engine/observe/trace_generators.hpp"
#include "engine/pipeline/artifacts.hpp"
#include "engine/substrate/accumulation.hpp"
#include "engine/substrate/admissibility.hpp"
#include "engine/substrate/operators.hpp"
#include "engine/substrate/state.hpp"
#include "engine/substrate/transitions.hpp"

#ifndef SSSL_DATA_DIR
#define SSSL_DATA_DIR "data"
#endif

namespace sssl {
namespace {

using substrate::StructuralState;
using substrate::Verdict;

constexpr StructuralState Z0 = StructuralState::Z0;
constexpr StructuralState Ep = StructuralState::Eplus;
constexpr StructuralState S = StructuralState::S;
constexpr StructuralState Em = StructuralState::Eminus;

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

void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  a: " << format_shortest(a) << "  b: " << format_shortest(b) << "\n";
  } else {
    pass(msg);
  }
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

void expect_state(StructuralState got, StructuralState want, std::string_view msg) {
  if (got != want) {
    fail(msg);
    std::cerr << "  got " << substrate::to_string(got) << " want " << substrate::to_string(want) << "\n";
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

std::vector<StructuralState> classify_rows(const std::vector<observe::Observation>& rows) {
  const auto dedt = observe::compute_dedt(rows);
  std::vector<StructuralState> out;
  for (std::size_t i = 0; i < rows.size(); ++i) {
    out.push_back(substrate::classify_state(rows[i].e_proxy, dedt[i], rows[i].discharge, ClassifyParams{}));
  }
  return out;
}

std::vector<StructuralState> classify_file(const char* name) {
  return classify_rows(observe::read_observations(std::filesystem::path(SSSL_DATA_DIR) / name));
}

std::vector<StructuralState> classify_negctl() {
  std::vector<observe::Observation> rows = observe::negative_control_trace();
  observe::sort_observations(rows);
  return classify_rows(rows);
}

void test_classifier() {
  const ClassifyParams p{};
  expect_state(substrate::classify_state(0.9, 0.0, 1, p), Em, "Classify: discharge wins over S");
  expect_state(substrate::classify_state(0.3, -0.15, 0, p), Em, "Classify: dE/dt == -drop is Eminus");
  expect_state(substrate::classify_state(0.3, -0.149, 0, p), Ep, "Classify: just above -drop is not Eminus");
  expect_state(substrate::classify_state(0.70, 0.02, 0, p), S, "Classify: E == taus, |dE/dt| == eps is S");
  expect_state(substrate::classify_state(0.8, 0.03, 0, p), Ep, "Classify: high E but steep is Eplus");
  expect_state(substrate::classify_state(0.05, -0.02, 0, p), Z0, "Classify: E == tau0, flat is Z0");
  expect_state(substrate::classify_state(0.5, 0.0, 0, p), Ep, "Classify: mid E flat is Eplus");

  ClassifyParams neg = p;
  neg.drop = -0.15;
  expect_state(substrate::classify_state(0.3, -0.2, 0, neg), Em, "Classify: drop sign ignored");

  StructuralState a{};
  expect_true(substrate::parse_state("Eminus", &a) && a == Em, "parse_state: Eminus");
  expect_true(!substrate::parse_state("E-", &a), "parse_state: rejects non-A4 token");
}

void test_accumulator() {
  AccumParams p;
  p.s0 = 0;
  p.s_max = 2;
  const std::vector<StructuralState> seq{Em, Em, Em, Ep, S, S, S, Em, Z0, Ep};
  const auto s = substrate::accumulate(seq, p);
  const std::vector<std::int64_t> want{1, 2, 2, 2, 1, 0, 0, 1, 0, 0};
  expect_true(s == want, "Accumulate: saturates at s_max, floors at 0, Z0 resets");

  AccumParams start;
  start.s0 = 7;
  const auto s2 = substrate::accumulate({Ep, S}, start);
  expect_true(s2.size() == 2 && s2[0] == 7 && s2[1] == 6, "Accumulate: starts from s0");

  expect_true(substrate::accumulate({}, AccumParams{}).empty(), "Accumulate: empty in, empty out");

  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  AccumParams wide;
  wide.s0 = 1;
  wide.s_max = kMax;
  wide.inc_on_eminus = kMax;
  wide.dec_on_s = kMax;
  const auto s3 = substrate::accumulate({Em, Em, Ep, S, Em}, wide);
  const std::vector<std::int64_t> want3{kMax, kMax, kMax, 0, kMax};
  expect_true(s3 == want3, "Accumulate: int64 extremes saturate at s_max and floor at 0");
  bool in_range = true;
  for (std::int64_t v : s3) {
    if (v < 0 || v > wide.s_max) in_range = false;
  }
  expect_true(in_range, "Accumulate: int64 extremes stay within [0, s_max]");

  AccumParams bad;
  bad.s0 = 60;
  expect_error(ErrorCode::kInvalidArgument, [&] { (void)substrate::accumulate(seq, bad); },
               "Accumulate: s0 > s_max rejected");
  bad = AccumParams{};
  bad.dec_on_s = -1;
  expect_error(ErrorCode::kInvalidArgument, [&] { (void)substrate::accumulate(seq, bad); },
               "Accumulate: negative dec_on_s rejected");
}

void test_operator_table() {
  std::ostringstream os;
  pipeline::render_operator_table_csv(os);
  expect_eq_str(os.str(),
                "a,b,Inv_s(a),\"Series_s(a,b)\",\"Parallel_s(a,b)\"\r\n"
                "Z0,Z0,Z0,Z0,Z0\r\n"
                "Z0,Eplus,Z0,Eplus,Eplus\r\n"
                "Z0,S,Z0,S,Eplus\r\n"
                "Z0,Eminus,Z0,Eminus,Eminus\r\n"
                "Eplus,Z0,Eminus,Eplus,Eplus\r\n"
                "Eplus,Eplus,Eminus,Eplus,Eplus\r\n"
                "Eplus,S,Eminus,Eplus,Eplus\r\n"
                "Eplus,Eminus,Eminus,Eminus,Eminus\r\n"
                "S,Z0,S,S,Eplus\r\n"
                "S,Eplus,S,Eplus,Eplus\r\n"
                "S,S,S,S,S\r\n"
                "S,Eminus,S,Eminus,Eminus\r\n"
                "Eminus,Z0,Eplus,Eminus,Eminus\r\n"
                "Eminus,Eplus,Eplus,Eminus,Eminus\r\n"
                "Eminus,S,Eplus,Eminus,Eminus\r\n"
                "Eminus,Eminus,Eplus,Eminus,Eminus\r\n",
                "Operators: full table");

  bool involution = true;
  for (const auto a : substrate::kA4) {
    if (substrate::inv_s(substrate::inv_s(a)) != a) involution = false;
  }
  expect_true(involution, "Operators: Inv_s is an involution");
}

void test_transitions() {
  const std::vector<StructuralState> seq{Z0, Ep, Ep, S, Em, Ep};
  const auto c = substrate::count_transitions(seq);
  std::uint64_t total = 0;
  for (std::size_t i = 0; i < substrate::kNumStates; ++i) total += substrate::row_sum(c, i);
  expect_true(total == seq.size() - 1, "Transitions: n-1 pairs, no wraparound");
  expect_true(c[0][1] == 1 && c[1][1] == 1 && c[1][2] == 1 && c[2][3] == 1 && c[3][1] == 1,
              "Transitions: counted pairs");

  const auto p = substrate::ratio_matrix(c);
  expect_true(p[1][1] == 0.5 && p[1][2] == 0.5, "P: row-normalised");
  expect_true(substrate::is_row_stochastic_or_zero(p), "P: rows sum to 1 or are zero");

  const auto pz = substrate::ratio_matrix(substrate::count_transitions({Ep, Ep}));
  expect_true(pz[0][0] == 0.0 && pz[0][1] == 0.0 && pz[0][2] == 0.0 && pz[0][3] == 0.0,
              "P: unvisited row stays all-zero");
  expect_true(substrate::is_row_stochastic_or_zero(pz), "P: zero rows accepted");

  substrate::Matrix broken = p;
  broken[1][1] = 0.4;
  expect_true(!substrate::is_row_stochastic_or_zero(broken), "P: row sum 0.9 rejected");

  std::ostringstream os;
  pipeline::render_p_matrix_csv(os, substrate::ratio_matrix(substrate::count_transitions(classify_file("sssl_smoke.csv"))));
  expect_eq_str(os.str(),
                "From\\To,Z0,Eplus,S,Eminus\r\n"
                "Z0,0.000000,1.000000,0.000000,0.000000\r\n"
                "Eplus,0.000000,0.941176,0.058824,0.000000\r\n"
                "S,0.000000,0.000000,0.800000,0.200000\r\n"
                "Eminus,0.000000,1.000000,0.000000,0.000000\r\n",
                "P: SMOKE P_matrix.csv");

  const auto pn = substrate::ratio_matrix(substrate::count_transitions(classify_negctl()));
  expect_true(pn[1][3] == 1.0 && pn[3][1] == 0.5 && pn[3][3] == 0.5, "P: negative control rows");
  expect_true(pn[0][1] == 0.0 && pn[2][2] == 0.0, "P: negative control zero rows");
}

void test_power_iteration() {
  std::mt19937_64 rng(0x5353534cULL);
  std::uniform_real_distribution<double> u(0.01, 1.0);

  bool all_ok = true;
  double worst = 0.0;
  for (int trial = 0; trial < 200; ++trial) {
    const std::size_t n = 2 + static_cast<std::size_t>(trial % 5);
    substrate::Matrix m(n, std::vector<double>(n, 0.0));
    for (auto& row : m) {
      double s = 0.0;
      for (double& x : row) {
        x = u(rng);
        s += x;
      }
      for (double& x : row) x /= s;
    }
    const double rho = substrate::spectral_radius_power_iteration(m);
    const double err = std::fabs(rho - 1.0);
    if (err > worst) worst = err;
    if (err > 1e-9) all_ok = false;
  }
  expect_true(all_ok, "Power iteration: rho = 1 for random row-stochastic matrices");
  std::cerr << "  worst |rho-1| = " << format_shortest(worst) << "\n";

  const substrate::Matrix zero(4, std::vector<double>(4, 0.0));
  expect_true(substrate::spectral_radius_power_iteration(zero) == 0.0, "Power iteration: zero matrix -> 0");

  const substrate::Matrix diag{{2.0, 0.0}, {0.0, 1.0}};
  expect_near(substrate::spectral_radius_power_iteration(diag), 2.0, 1e-12, "Power iteration: diag(2,1) -> 2");

  const substrate::Matrix ragged{{1.0, 0.0}, {0.0}};
  expect_error(ErrorCode::kData, [&] { (void)substrate::spectral_radius_power_iteration(ragged); },
               "Power iteration: non-square -> DataError");
}

void test_qr_spectrum() {
  const auto p = substrate::ratio_matrix(substrate::count_transitions(classify_file("sssl_smoke.csv")));
  const auto eigs = substrate::eigenvalues_qr(p);
  expect_true(eigs.size() == 4, "QR: four eigenvalues");
  expect_near(eigs[0], 0.0, 1e-12, "QR: lambda_Z0 = 0");
  expect_near(eigs[1], 1.0, 1e-10, "QR: lambda_Eplus = 1");
  expect_near(eigs[2], 0.724948128984, 1e-10, "QR: lambda_S");
  expect_near(eigs[3], 0.016228341604, 1e-10, "QR: lambda_Eminus");
  expect_near(substrate::spectral_radius_from_eigenvalues(eigs), 1.0, 1e-10, "QR: max |lambda| = 1");

  const substrate::Matrix diag{{3.0, 0.0, 0.0}, {0.0, -2.0, 0.0}, {0.0, 0.0, 0.5}};
  const auto d = substrate::eigenvalues_qr(diag);
  expect_near(std::fabs(d[0]), 3.0, 1e-12, "QR: diagonal input keeps |3|");
  expect_near(std::fabs(d[1]), 2.0, 1e-12, "QR: diagonal input keeps |-2|");
  expect_near(substrate::spectral_radius_from_eigenvalues({0.5, -4.0}), 4.0, 0.0, "QR: radius uses |lambda|");
}

void expect_metrics(const substrate::AdmResult& r, Verdict v, double collapse, double churn, std::size_t count_s,
                    double dwell, std::string_view name) {
  const std::string n(name);
  expect_true(r.verdict == v, n + ": verdict " + substrate::to_string(v));
  expect_eq_str(format_shortest(r.metrics.collapse_ratio), format_shortest(collapse), n + ": collapse_ratio");
  expect_eq_str(format_shortest(r.metrics.churn_ratio), format_shortest(churn), n + ": churn_ratio");
  expect_true(r.metrics.count_S == count_s, n + ": count_S");
  expect_eq_str(format_shortest(r.metrics.avg_dwell_S), format_shortest(dwell), n + ": avg_dwell_S");
}

void test_admissibility() {
  const AdmParams p{};

  const auto smoke = classify_file("sssl_smoke.csv");
  const auto sc = substrate::count_states(smoke);
  expect_true(smoke.size() == 25 && sc[0] == 1 && sc[1] == 18 && sc[2] == 5 && sc[3] == 1, "SMOKE: state census");
  const auto rs = substrate::evaluate_admissibility(smoke, p);
  expect_metrics(rs, Verdict::Allow, 0.04, 0.16, 5, 5.0, "SMOKE");

  std::ostringstream os;
  pipeline::render_adm_result(os, rs);
  expect_eq_str(os.str(),
                "SSSL admissibility verdict\n"
                "adm_E: ALLOW\n"
                "Metrics:\n"
                "avg_dwell_S: 5.0\n"
                "churn_ratio: 0.16\n"
                "collapse_ratio: 0.04\n"
                "count_S: 5.0\n",
                "SMOKE: adm_result.txt");

  const auto mech = classify_file("sssl_mech_vibration.csv");
  const auto mc = substrate::count_states(mech);
  expect_true(mc[0] == 8 && mc[1] == 46 && mc[2] == 5 && mc[3] == 1, "MECH: state census");
  expect_metrics(substrate::evaluate_admissibility(mech, p), Verdict::Allow, 1.0 / 60.0, 13.0 / 60.0, 5, 1.0,
                 "MECH");

  const auto fluid = classify_file("sssl_fluid_pressure.csv");
  const auto fc = substrate::count_states(fluid);
  expect_true(fc[0] == 10 && fc[1] == 50 && fc[2] == 9 && fc[3] == 1, "FLUID: state census");
  expect_metrics(substrate::evaluate_admissibility(fluid, p), Verdict::Allow, 1.0 / 70.0, 15.0 / 70.0, 9, 1.5,
                 "FLUID");

  const auto neg = classify_negctl();
  const auto nc = substrate::count_states(neg);
  expect_true(nc[0] == 0 && nc[1] == 133 && nc[2] == 0 && nc[3] == 267, "NEGCTL: state census");
  const auto rn = substrate::evaluate_admissibility(neg, p);
  expect_metrics(rn, Verdict::Abstain, 0.6675, 0.665, 0, 0.0, "NEGCTL");
  expect_eq_str(rn.fail_key, "collapse_ratio", "NEGCTL: collapse threshold tripped first");

  AdmParams need_s = p;
  need_s.require_s = 6;
  const auto r6 = substrate::evaluate_admissibility(smoke, need_s);
  expect_true(r6.verdict == Verdict::Abstain && r6.fail_key == "require_s", "SMOKE: require_s=6 -> ABSTAIN");

  AdmParams tight = p;
  tight.churn_ratio_max = 0.1;
  const auto rc = substrate::evaluate_admissibility(smoke, tight);
  expect_true(rc.verdict == Verdict::Abstain && rc.fail_key == "churn_ratio", "SMOKE: churn_ratio_max=0.1 -> ABSTAIN");

  expect_error(ErrorCode::kData, [&] { (void)substrate::evaluate_admissibility({}, p); },
               "Admissibility: empty sequence -> DataError");

  expect_true(substrate::avg_dwell({S, S, Ep, S, Ep, S, S, S}, S) == 2.0, "avg_dwell: runs 2,1,3");
  expect_true(substrate::count_churn({Z0, Z0, Ep, Ep, Em}) == 2, "count_churn: two changes");
}

}  // namespace
}  // namespace sssl

int main() {
  using namespace sssl;

  try {
    test_classifier();
    test_accumulator();
    test_operator_table();
    test_transitions();
    test_power_iteration();
    test_qr_spectrum();
    test_admissibility();
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
