#include "engine/capsule/invariants.hpp"

#include "engine/capsule/matrix_csv.hpp"
#include "engine/core/error.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/text_format.hpp"
#include "engine/pipeline/artifacts.hpp"
#include "engine/seal/manifest.hpp"
#include "engine/substrate/transitions.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace sssl::capsule {

namespace fs = std::filesystem;

namespace {

std::string strip_cr(std::string line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::string join(const std::set<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ",";
        out += s;
    }
    return out;
}

} // namespace

const std::vector<std::string>& required_artifacts() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> v{
            pipeline::kAdmResultTxt,
            pipeline::kCollapseCheckCsv,
            pipeline::kEigenspectrumTxt,
            pipeline::kOperatorTableCsv,
            pipeline::kPMatrixCsv,
            pipeline::kAccumulationCsv,
            pipeline::kStatesCsv,
            pipeline::kSummaryTxt,
            pipeline::kTransitionCountsCsv,
            pipeline::kTransitionRatiosCsv,
            seal::kManifestName,
        };
        std::sort(v.begin(), v.end());
        return v;
    }();
    return names;
}

std::size_t StateCensus::total() const noexcept {
    std::size_t n = 0;
    for (const std::size_t c : counts) n += c;
    return n;
}

StateCensus count_states_csv(const fs::path& states_csv) {
    StateCensus census;
    std::istringstream in(read_file(states_csv));

    std::string line;
    if (!std::getline(in, line)) return census;

    std::vector<std::string> cols = split_csv_row(strip_cr(line));
    for (auto& c : cols) c = trim(c);
    const auto it = std::find(cols.begin(), cols.end(), "a");
    const std::size_t idx = (it != cols.end()) ? static_cast<std::size_t>(it - cols.begin())
                                               : (cols.empty() ? 0 : cols.size() - 1);

    while (std::getline(in, line)) {
        const std::string row = trim(line);
        if (row.empty()) continue;
        const std::vector<std::string> parts = split_csv_row(row);
        if (idx >= parts.size()) continue;

        const std::string token = trim(parts[idx]);
        substrate::StructuralState a{};
        if (substrate::parse_state(token, &a)) {
            ++census.counts[substrate::index_of(a)];
        } else {
            census.others.insert(token);
        }
    }
    return census;
}

std::string read_adm_token(const fs::path& adm_txt) {
    std::istringstream in(read_file(adm_txt));
    std::string line;
    while (std::getline(in, line)) {
        const std::string s = trim(line);
        if (s.rfind("adm_E:", 0) == 0) return trim(std::string_view(s).substr(6));
    }
    return {};
}

void require_invariants(const fs::path& dir, substrate::Verdict expected) {
    for (const auto& name : required_artifacts()) require_file(dir / name);

    const std::string summary = read_file(dir / pipeline::kSummaryTxt);
    SSSL_ENSURE(summary.find(pipeline::kCollapseIdentityText) != std::string::npos, ErrorCode::kInvariant,
                "missing or wrong collapse invariant in summary.txt");

    const StateCensus census = count_states_csv(dir / pipeline::kStatesCsv);
    SSSL_ENSURE(census.others.empty(), ErrorCode::kInvariant, "non-A4 states found: " + join(census.others));
    SSSL_ENSURE(census.total() > 0, ErrorCode::kInvariant, "no A4 states counted");

    const substrate::Matrix p = read_matrix_csv(dir / pipeline::kPMatrixCsv);
    const double rho = substrate::spectral_radius_power_iteration(p);
    SSSL_ENSURE(std::fabs(rho - 1.0) <= kRhoTolerance, ErrorCode::kInvariant,
                "rho(P) not equal to 1 within tolerance: " + format_shortest(rho));

    const std::string adm = read_adm_token(dir / pipeline::kAdmResultTxt);
    substrate::Verdict got = substrate::Verdict::Allow;
    SSSL_ENSURE(substrate::parse_verdict(adm, &got), ErrorCode::kInvariant, "unrecognized adm_E token: " + adm);
    SSSL_ENSURE(got == expected, ErrorCode::kInvariant,
                "adm_E mismatch: got " + adm + " expected " + substrate::to_string(expected));

    const fs::path tr = dir / pipeline::kTransitionRatiosCsv;
    const fs::path pm = dir / pipeline::kPMatrixCsv;
    if (fs::file_size(tr) == fs::file_size(pm)) {
        SSSL_ENSURE(sha256_file(tr) != sha256_file(pm), ErrorCode::kInvariant,
                    "artifact semantic integrity failed: transition_ratios.csv equals P_matrix.csv");
    }

    log_debug("invariants hold: " + dir.generic_string());
}

} // namespace sssl::capsule
