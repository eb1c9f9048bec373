// ============================================================================
// Fragment 5.1 — Engine Artifact Renderers
// File: cpp/engine/pipeline/artifacts.hpp
// ============================================================================
//
// Purpose:
// - Render every engine artifact into a caller-supplied stream.
// - The renderers know nothing about directories, locales or sealing;
//   engine_run.cpp owns those concerns.
//
// Output discipline:
// - CSV artifacts: header row first, CRLF row terminator, minimal quoting.
// - Text artifacts: '\n' line terminator, trailing newline.
// - Numbers always go through format_fixed / format_shortest (std::to_chars),
//   so the imbued locale can never change a digit.
// ============================================================================

#pragma once

#include "engine/core/settings.hpp"
#include "engine/observe/observation.hpp"
#include "engine/substrate/admissibility.hpp"
#include "engine/substrate/state.hpp"
#include "engine/substrate/transitions.hpp"

#include <array>
#include <cstdint>
#include <ostream>
#include <vector>

namespace sssl::pipeline {

// Artifact file names.
inline constexpr const char* kStatesCsv = "sssl_states.csv";
inline constexpr const char* kAccumulationCsv = "sssl_accumulation.csv";
inline constexpr const char* kOperatorTableCsv = "operator_table.csv";
inline constexpr const char* kAdmResultTxt = "adm_result.txt";
inline constexpr const char* kTransitionCountsCsv = "transition_counts.csv";
inline constexpr const char* kTransitionRatiosCsv = "transition_ratios.csv";
inline constexpr const char* kPMatrixCsv = "P_matrix.csv";
inline constexpr const char* kEigenspectrumTxt = "eigenspectrum.txt";
inline constexpr const char* kCollapseCheckCsv = "collapse_check.csv";
inline constexpr const char* kSummaryTxt = "summary.txt";

// Literal written into summary.txt and looked up by the capsule.
inline constexpr const char* kCollapseIdentityText = "phi((m,a,s)) = m";

using substrate::StructuralState;

void render_states_csv(std::ostream& os,
                       const std::vector<observe::Observation>& rows,
                       const std::vector<double>& dedt,
                       const std::vector<StructuralState>& states);

void render_accumulation_csv(std::ostream& os,
                             const std::vector<observe::Observation>& rows,
                             const std::vector<StructuralState>& states,
                             const std::vector<std::int64_t>& accum);

void render_operator_table_csv(std::ostream& os);

// Metric lines are sorted by key; count_S is rendered as a real ("5.0").
void render_adm_result(std::ostream& os, const substrate::AdmResult& r);

void render_transition_counts_csv(std::ostream& os, const substrate::CountMatrix& counts);

// Compact labelled matrix, 6 decimals.
void render_p_matrix_csv(std::ostream& os, const substrate::Matrix& p);

// Long-form edge table: from,to,count,rowsum_from,ratio (16 rows).
void render_transition_ratios_csv(std::ostream& os, const substrate::CountMatrix& counts);

void render_eigenspectrum(std::ostream& os, const std::vector<double>& eigenvalues);

// phi(m, a, s) = m per sample; ok is 1 when the identity holds exactly.
void render_collapse_check_csv(std::ostream& os,
                               const std::vector<observe::Observation>& rows,
                               const std::vector<StructuralState>& states,
                               const std::vector<std::int64_t>& accum);

struct SummaryInputs final {
    ClassifyParams classify;
    AccumParams accum;
    AdmParams adm;
    bool substrate = false;
    std::size_t observations = 0;
    std::array<std::size_t, substrate::kNumStates> counts{};
};

void render_summary(std::ostream& os, const SummaryInputs& in);

// The projection phi((m, a, s)) = m.
inline constexpr double collapse(double m, StructuralState /*a*/, std::int64_t /*s*/) noexcept {
    return m;
}

} // namespace sssl::pipeline
