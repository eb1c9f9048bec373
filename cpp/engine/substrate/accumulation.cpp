#include "engine/substrate/accumulation.hpp"

namespace sssl::substrate {

std::vector<std::int64_t> accumulate(const std::vector<StructuralState>& states, const AccumParams& p) {
    p.validate_or_throw();

    std::vector<std::int64_t> out(states.size(), 0);
    std::int64_t cur = p.s0;
    for (std::size_t i = 0; i < states.size(); ++i) {
        switch (states[i]) {
            case StructuralState::Z0:
                cur = 0;
                break;
            case StructuralState::Eminus:
                // Saturate without forming cur + inc, which can exceed int64.
                cur = (p.inc_on_eminus >= p.s_max - cur) ? p.s_max : cur + p.inc_on_eminus;
                break;
            case StructuralState::S:
                cur = (p.dec_on_s >= cur) ? 0 : cur - p.dec_on_s;
                break;
            case StructuralState::Eplus:
                break;
        }
        out[i] = cur;
    }
    return out;
}

} // namespace sssl::substrate
