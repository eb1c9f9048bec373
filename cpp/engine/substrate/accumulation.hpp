// ============================================================================
// Fragment 2.2 — Accumulation Tracker (s-component of the (m, a, s) triple)
// File: cpp/engine/substrate/accumulation.hpp
// ============================================================================
//
// Sequential fold over the state sequence, starting at s0:
//   Z0     -> s = 0
//   Eminus -> s = min(s_max, s + inc_on_eminus)
//   S      -> s = max(0, s - dec_on_s)
//   Eplus  -> s unchanged
// Output is aligned 1:1 with the input sequence. With validated AccumParams
// every value lies in [0, s_max].
// ============================================================================

#pragma once
#include "engine/core/settings.hpp"
#include "engine/substrate/state.hpp"

#include <cstdint>
#include <vector>

namespace sssl::substrate {

std::vector<std::int64_t> accumulate(const std::vector<StructuralState>& states, const AccumParams& p);

} // namespace sssl::substrate
