#include "engine/pipeline/engine_run.hpp"

#include "engine/core/error.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/text_format.hpp"
#include "engine/observe/observation.hpp"
#include "engine/pipeline/artifacts.hpp"
#include "engine/seal/manifest.hpp"
#include "engine/substrate/accumulation.hpp"
#include "engine/substrate/state.hpp"
#include "engine/substrate/transitions.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace sssl::pipeline {

namespace fs = std::filesystem;

namespace {

std::locale resolve_locale(const std::string& name) {
    try {
        return std::locale(name);
    } catch (const std::runtime_error& e) {
        SSSL_THROW(ErrorCode::kInvalidArgument, "ExecEnv: unknown locale '" + name + "': " + e.what());
    }
}

// Renders one artifact through a stream carrying the run's locale, then
// writes the bytes and records the name for the manifest.
class ArtifactWriter final {
public:
    ArtifactWriter(fs::path dir, std::locale loc) : dir_(std::move(dir)), loc_(std::move(loc)) {}

    void emit(const char* name, const std::function<void(std::ostream&)>& render) {
        std::ostringstream os;
        os.imbue(loc_);
        render(os);
        SSSL_ENSURE(os.good(), ErrorCode::kIoError, std::string("render failed: ") + name);
        write_file(dir_ / name, os.str());
        written_.emplace_back(name);
        log_debug(std::string("wrote ") + name);
    }

    const std::vector<std::string>& written() const { return written_; }

private:
    fs::path dir_;
    std::locale loc_;
    std::vector<std::string> written_;
};

} // namespace

void EngineConfig::validate_or_throw() const {
    SSSL_ENSURE(!in_csv.empty(), ErrorCode::kInvalidArgument, "EngineConfig: in_csv is required");
    SSSL_ENSURE(!out_dir.empty(), ErrorCode::kInvalidArgument, "EngineConfig: out_dir is required");
    classify.validate_or_throw();
    if (substrate) {
        accum.validate_or_throw();
        adm.validate_or_throw();
    }
}

EngineResult run_engine(const EngineConfig& cfg, const ExecEnv& env) {
    cfg.validate_or_throw();
    env.validate_or_throw();
    const std::locale loc = resolve_locale(env.locale);

    // Nothing is written before the input has been fully accepted.
    const std::vector<observe::Observation> rows = observe::read_observations(cfg.in_csv);
    const std::vector<double> dedt = observe::compute_dedt(rows);

    std::vector<substrate::StructuralState> states;
    states.reserve(rows.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        states.push_back(substrate::classify_state(rows[i].e_proxy, dedt[i], rows[i].discharge, cfg.classify));
    }

    log_info("engine: " + std::to_string(rows.size()) + " observations from " + cfg.in_csv.generic_string() +
             " (" + env.describe() + ")");

    ensure_dir(cfg.out_dir);
    ArtifactWriter w(cfg.out_dir, loc);

    EngineResult res;
    res.out_dir = cfg.out_dir;
    res.observations = rows.size();

    w.emit(kStatesCsv, [&](std::ostream& os) { render_states_csv(os, rows, dedt, states); });

    if (cfg.substrate) {
        const std::vector<std::int64_t> accum = substrate::accumulate(states, cfg.accum);
        w.emit(kAccumulationCsv, [&](std::ostream& os) { render_accumulation_csv(os, rows, states, accum); });
        w.emit(kOperatorTableCsv, [](std::ostream& os) { render_operator_table_csv(os); });

        res.adm = substrate::evaluate_admissibility(states, cfg.adm);
        res.has_verdict = true;
        w.emit(kAdmResultTxt, [&](std::ostream& os) { render_adm_result(os, res.adm); });
        if (res.adm.verdict == substrate::Verdict::Abstain) {
            log_info("engine: adm_E=ABSTAIN (" + res.adm.fail_key + ")");
        } else {
            log_info("engine: adm_E=ALLOW");
        }

        const substrate::CountMatrix counts = substrate::count_transitions(states);
        const substrate::Matrix p = substrate::ratio_matrix(counts);
        SSSL_ENSURE(substrate::is_row_stochastic_or_zero(p), ErrorCode::kInvariant,
                    "transition matrix P has a row that neither sums to 1 nor is all-zero");

        w.emit(kTransitionCountsCsv, [&](std::ostream& os) { render_transition_counts_csv(os, counts); });
        w.emit(kTransitionRatiosCsv, [&](std::ostream& os) { render_transition_ratios_csv(os, counts); });
        w.emit(kPMatrixCsv, [&](std::ostream& os) { render_p_matrix_csv(os, p); });

        const std::vector<double> eigs = substrate::eigenvalues_qr(p);
        w.emit(kEigenspectrumTxt, [&](std::ostream& os) { render_eigenspectrum(os, eigs); });
        log_debug("engine: spectral radius estimate " +
                  format_fixed(substrate::spectral_radius_from_eigenvalues(eigs), 12));

        w.emit(kCollapseCheckCsv, [&](std::ostream& os) { render_collapse_check_csv(os, rows, states, accum); });
    }

    SummaryInputs si;
    si.classify = cfg.classify;
    si.accum = cfg.accum;
    si.adm = cfg.adm;
    si.substrate = cfg.substrate;
    si.observations = rows.size();
    si.counts = substrate::count_states(states);
    w.emit(kSummaryTxt, [&](std::ostream& os) { render_summary(os, si); });

    res.artifacts = w.written();
    std::sort(res.artifacts.begin(), res.artifacts.end());
    res.manifest = seal::seal_files(cfg.out_dir, res.artifacts, seal::ManifestStyle::kBinary);

    log_info("engine: sealed " + std::to_string(res.artifacts.size()) + " artifacts -> " +
             res.manifest.generic_string());
    return res;
}

} // namespace sssl::pipeline
