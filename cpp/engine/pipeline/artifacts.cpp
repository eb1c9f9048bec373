#include "engine/pipeline/artifacts.hpp"

#include "engine/core/error.hpp"
#include "engine/core/text_format.hpp"
#include "engine/substrate/operators.hpp"

#include <string>

namespace sssl::pipeline {

using substrate::kA4;
using substrate::kNumStates;
using substrate::to_string;

namespace {

std::vector<std::string> matrix_header() {
    std::vector<std::string> h{"From\\To"};
    for (const auto a : kA4) h.emplace_back(to_string(a));
    return h;
}

void require_aligned(std::size_t n, std::size_t m, const char* what) {
    SSSL_ENSURE(n == m, ErrorCode::kInternal, std::string(what) + ": sequence lengths differ");
}

} // namespace

void render_states_csv(std::ostream& os,
                       const std::vector<observe::Observation>& rows,
                       const std::vector<double>& dedt,
                       const std::vector<StructuralState>& states) {
    require_aligned(rows.size(), dedt.size(), kStatesCsv);
    require_aligned(rows.size(), states.size(), kStatesCsv);

    write_csv_row(os, {"t_s", "E_proxy", "dE_dt", "discharge", "a_state"});
    for (std::size_t i = 0; i < rows.size(); ++i) {
        write_csv_row(os, {format_fixed(rows[i].t_s, 6),
                           format_fixed(rows[i].e_proxy, 6),
                           format_fixed(dedt[i], 6),
                           std::to_string(rows[i].discharge),
                           to_string(states[i])});
    }
}

void render_accumulation_csv(std::ostream& os,
                             const std::vector<observe::Observation>& rows,
                             const std::vector<StructuralState>& states,
                             const std::vector<std::int64_t>& accum) {
    require_aligned(rows.size(), states.size(), kAccumulationCsv);
    require_aligned(rows.size(), accum.size(), kAccumulationCsv);

    write_csv_row(os, {"t_s", "E_proxy", "a_state", "s"});
    for (std::size_t i = 0; i < rows.size(); ++i) {
        write_csv_row(os, {format_fixed(rows[i].t_s, 6),
                           format_fixed(rows[i].e_proxy, 6),
                           to_string(states[i]),
                           std::to_string(accum[i])});
    }
}

void render_operator_table_csv(std::ostream& os) {
    write_csv_row(os, {"a", "b", "Inv_s(a)", "Series_s(a,b)", "Parallel_s(a,b)"});
    for (const auto& r : substrate::operator_table()) {
        write_csv_row(os, {to_string(r.a), to_string(r.b), to_string(r.inv_a),
                           to_string(r.series), to_string(r.parallel)});
    }
}

void render_adm_result(std::ostream& os, const substrate::AdmResult& r) {
    os << "SSSL admissibility verdict\n";
    os << "adm_E: " << substrate::to_string(r.verdict) << "\n";
    os << "Metrics:\n";
    // Byte order of the keys.
    os << "avg_dwell_S: " << format_shortest(r.metrics.avg_dwell_S) << "\n";
    os << "churn_ratio: " << format_shortest(r.metrics.churn_ratio) << "\n";
    os << "collapse_ratio: " << format_shortest(r.metrics.collapse_ratio) << "\n";
    os << "count_S: " << format_shortest(static_cast<double>(r.metrics.count_S)) << "\n";
}

void render_transition_counts_csv(std::ostream& os, const substrate::CountMatrix& counts) {
    write_csv_row(os, matrix_header());
    for (std::size_t i = 0; i < kNumStates; ++i) {
        std::vector<std::string> row{to_string(kA4[i])};
        for (std::size_t j = 0; j < kNumStates; ++j) row.push_back(std::to_string(counts[i][j]));
        write_csv_row(os, row);
    }
}

void render_p_matrix_csv(std::ostream& os, const substrate::Matrix& p) {
    SSSL_ENSURE(p.size() == kNumStates, ErrorCode::kInternal, "P must be 4x4");
    write_csv_row(os, matrix_header());
    for (std::size_t i = 0; i < kNumStates; ++i) {
        SSSL_ENSURE(p[i].size() == kNumStates, ErrorCode::kInternal, "P must be 4x4");
        std::vector<std::string> row{to_string(kA4[i])};
        for (std::size_t j = 0; j < kNumStates; ++j) row.push_back(format_fixed(p[i][j], 6));
        write_csv_row(os, row);
    }
}

void render_transition_ratios_csv(std::ostream& os, const substrate::CountMatrix& counts) {
    write_csv_row(os, {"from", "to", "count", "rowsum_from", "ratio"});
    for (std::size_t i = 0; i < kNumStates; ++i) {
        const std::uint64_t rs = substrate::row_sum(counts, i);
        for (std::size_t j = 0; j < kNumStates; ++j) {
            const std::uint64_t c = counts[i][j];
            const double ratio = rs > 0 ? static_cast<double>(c) / static_cast<double>(rs) : 0.0;
            write_csv_row(os, {to_string(kA4[i]), to_string(kA4[j]), std::to_string(c),
                               std::to_string(rs), format_fixed(ratio, 6)});
        }
    }
}

void render_eigenspectrum(std::ostream& os, const std::vector<double>& eigenvalues) {
    os << "SSSL spectral artifact (deterministic QR iteration)\n";
    os << "Matrix order: [Z0, Eplus, S, Eminus]\n";
    os << "Eigenvalues (approx):\n";
    for (const double ev : eigenvalues) os << format_fixed(ev, 12) << "\n";
    os << "\nSpectral radius estimate:\n";
    os << format_fixed(substrate::spectral_radius_from_eigenvalues(eigenvalues), 12) << "\n";
}

void render_collapse_check_csv(std::ostream& os,
                               const std::vector<observe::Observation>& rows,
                               const std::vector<StructuralState>& states,
                               const std::vector<std::int64_t>& accum) {
    require_aligned(rows.size(), states.size(), kCollapseCheckCsv);
    require_aligned(rows.size(), accum.size(), kCollapseCheckCsv);

    write_csv_row(os, {"t_s", "m", "a_state", "s", "phi(m,a,s)", "ok"});
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const double m = rows[i].e_proxy;
        const double phi = collapse(m, states[i], accum[i]);
        const bool ok = (phi == m);
        SSSL_ENSURE(ok, ErrorCode::kInvariant,
                    "collapse identity phi((m,a,s)) = m violated at t_s=" + format_fixed(rows[i].t_s, 6));
        write_csv_row(os, {format_fixed(rows[i].t_s, 6), format_fixed(m, 6), to_string(states[i]),
                           std::to_string(accum[i]), format_fixed(phi, 6), ok ? "1" : "0"});
    }
}

void render_summary(std::ostream& os, const SummaryInputs& in) {
    os << "SSSL Verifier — summary\n";
    os << "\n";
    os << "State space: A4 = {Z0, Eplus, S, Eminus}\n";
    os << "Conservative extension: " << kCollapseIdentityText << "\n";
    os << "\n";
    os << "Deterministic parameters:\n";
    os << "tau0=" << format_shortest(in.classify.tau0) << "\n";
    os << "taus=" << format_shortest(in.classify.taus) << "\n";
    os << "eps=" << format_shortest(in.classify.eps) << "\n";
    os << "drop=" << format_shortest(in.classify.drop) << "\n";

    if (in.substrate) {
        os << "\n";
        os << "Accumulation parameters:\n";
        os << "s0=" << std::to_string(in.accum.s0) << "\n";
        os << "s_max=" << std::to_string(in.accum.s_max) << "\n";
        os << "inc_on_eminus=" << std::to_string(in.accum.inc_on_eminus) << "\n";
        os << "dec_on_s=" << std::to_string(in.accum.dec_on_s) << "\n";
        os << "\n";
        os << "Admissibility parameters:\n";
        os << "collapse_ratio_max=" << format_shortest(in.adm.collapse_ratio_max) << "\n";
        os << "churn_ratio_max=" << format_shortest(in.adm.churn_ratio_max) << "\n";
        os << "require_s=" << std::to_string(in.adm.require_s) << "\n";
    }

    os << "\n";
    os << "Observations: " << std::to_string(in.observations) << "\n";
    os << "State counts:\n";
    for (std::size_t i = 0; i < kNumStates; ++i) {
        os << to_string(kA4[i]) << ": " << std::to_string(in.counts[i]) << "\n";
    }
    os << "\n";
    os << "Rules (deterministic):\n";
    os << "- Eminus: discharge=1 OR dE/dt <= -drop\n";
    os << "- S: E_proxy >= taus AND |dE/dt| <= eps\n";
    os << "- Z0: E_proxy <= tau0 AND |dE/dt| <= eps\n";
    os << "- Otherwise: Eplus\n";
}

} // namespace sssl::pipeline
