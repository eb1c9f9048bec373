// ============================================================================
// Fragment 2.5 — Trace Admissibility (ALLOW / ABSTAIN)
// File: cpp/engine/substrate/admissibility.hpp
// ============================================================================
//
// Reduces a whole state sequence (length n) to four metrics:
//   collapse_ratio = count(Eminus) / n
//   churn_ratio    = (# adjacent label changes) / n
//   count_S        = count(S)
//   avg_dwell_S    = mean length of maximal S runs (0 if none)
//
// Verdict (checked in this order, first trip wins for fail_key):
//   ABSTAIN if collapse_ratio > collapse_ratio_max
//   ABSTAIN if churn_ratio    > churn_ratio_max
//   ABSTAIN if count_S        < require_s
//   ALLOW   otherwise
// ============================================================================

#pragma once
#include "engine/core/settings.hpp"
#include "engine/substrate/state.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sssl::substrate {

enum class Verdict : std::uint8_t {
    Allow = 0,
    Abstain = 1
};

const char* to_string(Verdict v) noexcept;

bool parse_verdict(std::string_view token, Verdict* out) noexcept;

struct AdmMetrics final {
    double collapse_ratio = 0.0;
    double churn_ratio = 0.0;
    std::size_t count_S = 0;
    double avg_dwell_S = 0.0;
};

struct AdmResult final {
    Verdict verdict = Verdict::Allow;
    AdmMetrics metrics;

    // Empty on ALLOW; otherwise the threshold that tripped:
    // "collapse_ratio", "churn_ratio" or "require_s".
    std::string fail_key;
};

std::size_t count_churn(const std::vector<StructuralState>& states) noexcept;

double avg_dwell(const std::vector<StructuralState>& states, StructuralState target) noexcept;

// Requires a non-empty sequence (kData otherwise).
AdmResult evaluate_admissibility(const std::vector<StructuralState>& states, const AdmParams& p);

} // namespace sssl::substrate
