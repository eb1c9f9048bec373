// ============================================================================
// Fragment 6.2 — Capsule: Per-Directory Invariant Gate
// File: cpp/engine/capsule/invariants.hpp
// ============================================================================
//
// Checks one sealed replay directory, in this order; the first failure
// throws and nothing after it runs:
//
//   1. every required artifact exists                  (kMissingArtifact)
//   2. summary.txt carries "phi((m,a,s)) = m"          (kInvariant)
//   3. sssl_states.csv state column holds only A4 tokens, at least one
//                                                      (kInvariant)
//   4. P_matrix.csv: |rho(P) - 1| <= 1e-9 by power iteration
//                                                      (kData / kInvariant)
//   5. adm_result.txt verdict equals the expected one  (kInvariant)
//   6. transition_ratios.csv is not a byte copy of P_matrix.csv
//                                                      (kInvariant)
// ============================================================================

#pragma once

#include "engine/substrate/admissibility.hpp"
#include "engine/substrate/state.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace sssl::capsule {

inline constexpr double kRhoTolerance = 1e-9;

// Sorted; includes the capsule-written MANIFEST.sha256.
const std::vector<std::string>& required_artifacts();

struct StateCensus final {
    std::array<std::size_t, substrate::kNumStates> counts{};
    std::set<std::string> others;  // tokens outside A4

    std::size_t total() const noexcept;
};

// State column is "a" when the header has one, else the last column.
StateCensus count_states_csv(const std::filesystem::path& states_csv);

// Value after "adm_E:" on the first such line; empty when absent.
std::string read_adm_token(const std::filesystem::path& adm_txt);

void require_invariants(const std::filesystem::path& dir, substrate::Verdict expected);

} // namespace sssl::capsule
