#include "engine/substrate/operators.hpp"

namespace sssl::substrate {

StructuralState inv_s(StructuralState a) noexcept {
    switch (a) {
        case StructuralState::Eplus:  return StructuralState::Eminus;
        case StructuralState::Eminus: return StructuralState::Eplus;
        case StructuralState::Z0:
        case StructuralState::S:
            break;
    }
    return a;
}

StructuralState series_s(StructuralState a, StructuralState b) noexcept {
    if (a == StructuralState::Eminus || b == StructuralState::Eminus) return StructuralState::Eminus;
    if (a == StructuralState::S && b == StructuralState::S) return StructuralState::S;
    if (a == StructuralState::Z0) return b;
    if (b == StructuralState::Z0) return a;
    // Remaining pairs: (S, Eplus), (Eplus, S), (Eplus, Eplus).
    return StructuralState::Eplus;
}

StructuralState parallel_s(StructuralState a, StructuralState b) noexcept {
    if (a == StructuralState::Eminus || b == StructuralState::Eminus) return StructuralState::Eminus;
    if (a == StructuralState::S && b == StructuralState::S) return StructuralState::S;
    if (a == StructuralState::Z0 && b == StructuralState::Z0) return StructuralState::Z0;
    return StructuralState::Eplus;
}

std::array<OperatorRow, kOperatorRows> operator_table() noexcept {
    std::array<OperatorRow, kOperatorRows> rows{};
    std::size_t k = 0;
    for (StructuralState a : kA4) {
        for (StructuralState b : kA4) {
            OperatorRow& r = rows[k++];
            r.a = a;
            r.b = b;
            r.inv_a = inv_s(a);
            r.series = series_s(a, b);
            r.parallel = parallel_s(a, b);
        }
    }
    return rows;
}

} // namespace sssl::substrate
