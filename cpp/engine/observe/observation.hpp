// ============================================================================
// Fragment 3.1 — Observation Ingestor (t_s, E_proxy, discharge)
// File: cpp/engine/observe/observation.hpp
// ============================================================================
//
// Purpose:
// - Parse and validate the fixed 3-column observation CSV at the boundary,
//   producing strongly typed records. Nothing downstream re-parses text.
// - Sort deterministically and derive dE/dt.
//
// Input contract:
// - Header exactly "t_s,E_proxy,discharge" (order-sensitive).
// - Each row: t_s finite real, E_proxy finite real >= 0, discharge in {0,1}.
// - At least 2 rows.
//
// Failure mapping:
// - header/row problems     -> ErrorCode::kValidation (row errors name the line)
// - fewer than 2 rows       -> ErrorCode::kData
// - file absent             -> ErrorCode::kMissingArtifact
//
// Derivative policy:
// - d_0 = 0, and d_i = 0 whenever t_i == t_{i-1} (no division by zero).
// ============================================================================

#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <tuple>
#include <vector>

namespace sssl::observe {

inline constexpr const char* kObservationHeader = "t_s,E_proxy,discharge";
inline constexpr std::size_t kMinObservations = 2;

struct Observation final {
    double t_s = 0.0;
    double e_proxy = 0.0;
    int discharge = 0;

    friend bool operator<(const Observation& a, const Observation& b) noexcept {
        return std::tie(a.t_s, a.e_proxy, a.discharge) < std::tie(b.t_s, b.e_proxy, b.discharge);
    }
};

// source_name only labels error messages.
std::vector<Observation> parse_observations_csv(std::istream& in, const std::string& source_name);

std::vector<Observation> read_observations(const std::filesystem::path& csv_path);

// Stable sort by (t_s, E_proxy, discharge).
void sort_observations(std::vector<Observation>& rows);

std::vector<double> compute_dedt(const std::vector<Observation>& rows);

} // namespace sssl::observe
