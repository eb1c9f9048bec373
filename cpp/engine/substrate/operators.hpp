// ============================================================================
// Fragment 2.3 — Operator Algebra over A4 (Inv_s, Series_s, Parallel_s)
// File: cpp/engine/substrate/operators.hpp
// ============================================================================
//
// Inv_s      : involution. Z0 and S fixed, Eplus <-> Eminus.
// Series_s   : commutative, Eminus absorbing, Z0 two-sided identity,
//              S.S = S, S.Eplus = Eplus, Eplus.Eplus = Eplus.
// Parallel_s : commutative, Eminus absorbing, Z0.Z0 = Z0, S.S = S,
//              every other pair resolves to Eplus.
//
// The table is input-independent and is emitted verbatim as
// operator_table.csv (16 rows, a-major in canonical A4 order).
// ============================================================================

#pragma once
#include "engine/substrate/state.hpp"

#include <array>
#include <cstddef>

namespace sssl::substrate {

StructuralState inv_s(StructuralState a) noexcept;
StructuralState series_s(StructuralState a, StructuralState b) noexcept;
StructuralState parallel_s(StructuralState a, StructuralState b) noexcept;

struct OperatorRow final {
    StructuralState a = StructuralState::Z0;
    StructuralState b = StructuralState::Z0;
    StructuralState inv_a = StructuralState::Z0;
    StructuralState series = StructuralState::Z0;
    StructuralState parallel = StructuralState::Z0;
};

inline constexpr std::size_t kOperatorRows = kNumStates * kNumStates;

std::array<OperatorRow, kOperatorRows> operator_table() noexcept;

} // namespace sssl::substrate
