// ============================================================================
// Fragment 2.1 — Structural State Alphabet A4 + Posture Classifier
// File: cpp/engine/substrate/state.hpp
// ============================================================================
//
// Purpose:
// - The closed posture alphabet A4 = {Z0, Eplus, S, Eminus}.
// - The deterministic per-sample rule that maps (E, dE/dt, discharge) to A4.
//
// Rule priority (first match wins, order is load-bearing):
//   1) Eminus : discharge == 1  OR  dE/dt <= -|drop|
//   2) S      : E >= taus       AND |dE/dt| <= eps
//   3) Z0     : E <= tau0       AND |dE/dt| <= eps
//   4) Eplus  : everything else
//
// Canonical order [Z0, Eplus, S, Eminus] is also the row/column order of every
// transition matrix artifact.
// ============================================================================

#pragma once
#include "engine/core/settings.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace sssl::substrate {

enum class StructuralState : std::uint8_t {
    Z0 = 0,
    Eplus = 1,
    S = 2,
    Eminus = 3
};

inline constexpr std::size_t kNumStates = 4;

inline constexpr std::array<StructuralState, kNumStates> kA4 = {
    StructuralState::Z0, StructuralState::Eplus, StructuralState::S, StructuralState::Eminus};

inline constexpr std::size_t index_of(StructuralState a) noexcept {
    return static_cast<std::size_t>(a);
}

const char* to_string(StructuralState a) noexcept;

// Exact token match only ("Z0", "Eplus", "S", "Eminus").
bool parse_state(std::string_view token, StructuralState* out) noexcept;

StructuralState classify_state(double e, double dedt, int discharge, const ClassifyParams& p) noexcept;

std::array<std::size_t, kNumStates> count_states(const std::vector<StructuralState>& states) noexcept;

} // namespace sssl::substrate
