// ============================================================================
// Fragment 2.1 — Structural State Alphabet A4 + Posture Classifier
// File: cpp/engine/substrate/state.cpp
// ============================================================================

#include "engine/substrate/state.hpp"

#include <cmath>

namespace sssl::substrate {

const char* to_string(StructuralState a) noexcept {
    switch (a) {
        case StructuralState::Z0:     return "Z0";
        case StructuralState::Eplus:  return "Eplus";
        case StructuralState::S:      return "S";
        case StructuralState::Eminus: return "Eminus";
    }
    return "?";
}

bool parse_state(std::string_view token, StructuralState* out) noexcept {
    if (!out) return false;
    for (StructuralState a : kA4) {
        if (token == to_string(a)) {
            *out = a;
            return true;
        }
    }
    return false;
}

StructuralState classify_state(double e, double dedt, int discharge, const ClassifyParams& p) noexcept {
    if (discharge == 1 || dedt <= -std::fabs(p.drop)) {
        return StructuralState::Eminus;
    }
    if (e >= p.taus && std::fabs(dedt) <= p.eps) {
        return StructuralState::S;
    }
    if (e <= p.tau0 && std::fabs(dedt) <= p.eps) {
        return StructuralState::Z0;
    }
    return StructuralState::Eplus;
}

std::array<std::size_t, kNumStates> count_states(const std::vector<StructuralState>& states) noexcept {
    std::array<std::size_t, kNumStates> counts{};
    for (StructuralState a : states) ++counts[index_of(a)];
    return counts;
}

} // namespace sssl::substrate
