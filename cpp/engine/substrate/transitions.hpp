// ============================================================================
// Fragment 2.4 — Transition Statistics + Spectral Procedures
// File: cpp/engine/substrate/transitions.hpp
// ============================================================================
//
// Purpose:
// - Count consecutive (a_i, a_{i+1}) pairs into a 4x4 matrix (no wraparound).
// - Row-normalize into the ratio matrix P. A row with no outgoing mass stays
//   all-zero; it is never replaced by a uniform row.
// - Two fixed-iteration numeric procedures over square matrices:
//     * power iteration (80 steps, infinity-norm normalization) -> rho estimate
//     * unshifted QR iteration (200 steps, Gram-Schmidt QR) -> eigenvalues
//
// Perron-Frobenius: a row-stochastic P has rho(P) = 1. The capsule uses the
// power-iteration estimate as a structural self-check.
//
// Known simplification:
// - eigenvalues_qr() reports the real diagonal only. Complex-conjugate pairs
//   are not resolved; their imaginary part is dropped. The output feeds the
//   informational eigenspectrum.txt artifact, not a pass/fail invariant.
// ============================================================================

#pragma once
#include "engine/substrate/state.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sssl::substrate {

using CountMatrix = std::array<std::array<std::uint64_t, kNumStates>, kNumStates>;
using Matrix = std::vector<std::vector<double>>;

inline constexpr int kPowerIterations = 80;
inline constexpr int kQrIterations = 200;
inline constexpr double kRowSumTolerance = 1e-12;

CountMatrix count_transitions(const std::vector<StructuralState>& states) noexcept;

std::uint64_t row_sum(const CountMatrix& counts, std::size_t row) noexcept;

// 4x4 ratio matrix P in canonical A4 order.
Matrix ratio_matrix(const CountMatrix& counts);

// True when every row sums to 1 within tol or is exactly all-zero.
bool is_row_stochastic_or_zero(const Matrix& p, double tol = kRowSumTolerance) noexcept;

// Start from the uniform vector; v <- M v; normalize by the infinity norm.
// Returns the last normalization factor, or 0 as soon as it hits 0.
// Requires a non-empty square matrix (kData otherwise).
double spectral_radius_power_iteration(const Matrix& m, int iters = kPowerIterations);

// Unshifted QR iteration A_{k+1} = R_k Q_k. Returns Re(diag(A_final)).
// A column whose Gram-Schmidt residual has zero norm yields a zero Q column.
std::vector<double> eigenvalues_qr(const Matrix& a, int iters = kQrIterations);

// max |lambda| over eigenvalues_qr() output (0 for an empty list).
double spectral_radius_from_eigenvalues(const std::vector<double>& eigs) noexcept;

} // namespace sssl::substrate
