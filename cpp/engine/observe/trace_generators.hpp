// ============================================================================
// Fragment 3.3 — Deterministic Trace Generators
// File: cpp/engine/observe/trace_generators.hpp
// ============================================================================
//
// Purpose:
// - Synthesize fixed observation traces in the standard 3-column schema.
// - No randomness, no clock: identical arguments => identical bytes.
//
// Traces:
// - negative_control : alternating E = 1,0,1,0,... with discharge on every
//                      third sample (i % 3 == 0). High churn, no S dwell.
//                      Used by the capsule's NEGCTL_ABSTAIN case.
// - smoke            : ramp (10) -> plateau (6) -> drop with discharge (1)
//                      -> ramp (8). Functional smoke test.
// - mech_vibration   : idle / envelope ramp / plateau with small oscillation
//                      / shock with discharge / recovery.
// - fluid_pressure   : idle / pump ramp / regulated plateau with ripple /
//                      valve release with discharge / recovery.
//
// These are functional test signals. They make no claim of physical validity.
// ============================================================================

#pragma once
#include "engine/observe/observation.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sssl::observe {

inline constexpr std::size_t kNegativeControlSamples = 400;

enum class TraceStyle : int {
    // "i,E,d" lines joined by '\n', E rendered as 1.0 / 0.0.
    kPlainLf = 0,
    // CRLF rows, values in shortest round-trip form.
    kShortestCsv = 1,
    // CRLF rows, values with 12 significant digits.
    kGeneral12Csv = 2,
};

std::vector<Observation> negative_control_trace(std::size_t n = kNegativeControlSamples);

std::vector<Observation> smoke_trace();

// n is raised to at least 10.
std::vector<Observation> mech_vibration_trace(std::size_t n = 60, double dt = 0.1);
std::vector<Observation> fluid_pressure_trace(std::size_t n = 70, double dt = 0.1);

std::string render_trace_csv(const std::vector<Observation>& rows, TraceStyle style);

void write_trace_csv(const std::filesystem::path& out_csv,
                     const std::vector<Observation>& rows,
                     TraceStyle style);

} // namespace sssl::observe
