#include "engine/substrate/admissibility.hpp"

#include "engine/core/error.hpp"

namespace sssl::substrate {

const char* to_string(Verdict v) noexcept {
    switch (v) {
        case Verdict::Allow:   return "ALLOW";
        case Verdict::Abstain: return "ABSTAIN";
    }
    return "?";
}

bool parse_verdict(std::string_view token, Verdict* out) noexcept {
    if (!out) return false;
    if (token == "ALLOW")   { *out = Verdict::Allow;   return true; }
    if (token == "ABSTAIN") { *out = Verdict::Abstain; return true; }
    return false;
}

std::size_t count_churn(const std::vector<StructuralState>& states) noexcept {
    std::size_t churn = 0;
    for (std::size_t i = 1; i < states.size(); ++i) {
        if (states[i] != states[i - 1]) ++churn;
    }
    return churn;
}

double avg_dwell(const std::vector<StructuralState>& states, StructuralState target) noexcept {
    std::size_t runs = 0;
    std::size_t total = 0;
    std::size_t cur = 0;
    for (StructuralState a : states) {
        if (a == target) {
            ++cur;
        } else if (cur > 0) {
            ++runs;
            total += cur;
            cur = 0;
        }
    }
    if (cur > 0) {
        ++runs;
        total += cur;
    }
    return runs == 0 ? 0.0 : static_cast<double>(total) / static_cast<double>(runs);
}

AdmResult evaluate_admissibility(const std::vector<StructuralState>& states, const AdmParams& p) {
    p.validate_or_throw();
    SSSL_ENSURE(!states.empty(), ErrorCode::kData, "admissibility needs a non-empty state sequence");

    const double n = static_cast<double>(states.size());
    const auto counts = count_states(states);

    AdmResult r;
    r.metrics.collapse_ratio = static_cast<double>(counts[index_of(StructuralState::Eminus)]) / n;
    r.metrics.churn_ratio = static_cast<double>(count_churn(states)) / n;
    r.metrics.count_S = counts[index_of(StructuralState::S)];
    r.metrics.avg_dwell_S = avg_dwell(states, StructuralState::S);

    if (r.metrics.collapse_ratio > p.collapse_ratio_max) {
        r.fail_key = "collapse_ratio";
    } else if (r.metrics.churn_ratio > p.churn_ratio_max) {
        r.fail_key = "churn_ratio";
    } else if (static_cast<std::int64_t>(r.metrics.count_S) < p.require_s) {
        r.fail_key = "require_s";
    }
    r.verdict = r.fail_key.empty() ? Verdict::Allow : Verdict::Abstain;
    return r;
}

} // namespace sssl::substrate
