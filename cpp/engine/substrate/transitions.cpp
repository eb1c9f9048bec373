// ============================================================================
// Fragment 2.4 — Transition Statistics + Spectral Procedures
// File: cpp/engine/substrate/transitions.cpp
// ============================================================================

#include "engine/substrate/transitions.hpp"

#include "engine/core/error.hpp"

#include <cmath>
#include <utility>

namespace sssl::substrate {

namespace {

// Accumulation order matters for bit-stable output: always left to right.
double dot(const std::vector<double>& u, const std::vector<double>& v) noexcept {
    double s = 0.0;
    for (std::size_t i = 0; i < u.size(); ++i) s += u[i] * v[i];
    return s;
}

Matrix zeros(std::size_t n, std::size_t m) {
    return Matrix(n, std::vector<double>(m, 0.0));
}

Matrix matmul(const Matrix& x, const Matrix& y) {
    const std::size_t n = x.size();
    const std::size_t k = y.size();
    const std::size_t m = y.empty() ? 0 : y[0].size();
    Matrix out = zeros(n, m);
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < m; ++j) {
            double s = 0.0;
            for (std::size_t t = 0; t < k; ++t) s += x[i][t] * y[t][j];
            out[i][j] = s;
        }
    }
    return out;
}

std::vector<double> column(const Matrix& m, std::size_t j) {
    std::vector<double> c(m.size(), 0.0);
    for (std::size_t r = 0; r < m.size(); ++r) c[r] = m[r][j];
    return c;
}

void qr_decompose(const Matrix& a, Matrix& q, Matrix& r) {
    const std::size_t n = a.size();
    q = zeros(n, n);
    r = zeros(n, n);
    for (std::size_t j = 0; j < n; ++j) {
        std::vector<double> v = column(a, j);
        for (std::size_t i = 0; i < j; ++i) {
            const std::vector<double> qi = column(q, i);
            r[i][j] = dot(qi, v);
            for (std::size_t k = 0; k < n; ++k) v[k] -= r[i][j] * qi[k];
        }
        r[j][j] = std::sqrt(dot(v, v));
        if (r[j][j] == 0.0) {
            for (std::size_t k = 0; k < n; ++k) q[k][j] = 0.0;
        } else {
            for (std::size_t k = 0; k < n; ++k) q[k][j] = v[k] / r[j][j];
        }
    }
}

void require_square(const Matrix& m) {
    SSSL_ENSURE(!m.empty(), ErrorCode::kData, "matrix is empty");
    for (const auto& row : m) {
        SSSL_ENSURE(row.size() == m.size(), ErrorCode::kData, "matrix is not square");
    }
}

} // namespace

CountMatrix count_transitions(const std::vector<StructuralState>& states) noexcept {
    CountMatrix counts{};
    for (std::size_t i = 0; i + 1 < states.size(); ++i) {
        ++counts[index_of(states[i])][index_of(states[i + 1])];
    }
    return counts;
}

std::uint64_t row_sum(const CountMatrix& counts, std::size_t row) noexcept {
    std::uint64_t s = 0;
    for (std::uint64_t c : counts[row]) s += c;
    return s;
}

Matrix ratio_matrix(const CountMatrix& counts) {
    Matrix p = zeros(kNumStates, kNumStates);
    for (std::size_t i = 0; i < kNumStates; ++i) {
        const std::uint64_t rs = row_sum(counts, i);
        if (rs == 0) continue;
        for (std::size_t j = 0; j < kNumStates; ++j) {
            p[i][j] = static_cast<double>(counts[i][j]) / static_cast<double>(rs);
        }
    }
    return p;
}

bool is_row_stochastic_or_zero(const Matrix& p, double tol) noexcept {
    for (const auto& row : p) {
        bool all_zero = true;
        double s = 0.0;
        for (double x : row) {
            if (!std::isfinite(x) || x < 0.0) return false;
            if (x != 0.0) all_zero = false;
            s += x;
        }
        if (all_zero) continue;
        if (std::fabs(s - 1.0) > tol) return false;
    }
    return true;
}

double spectral_radius_power_iteration(const Matrix& m, int iters) {
    require_square(m);
    const std::size_t n = m.size();

    std::vector<double> v(n, 1.0 / static_cast<double>(n));
    double rho = 0.0;
    for (int it = 0; it < iters; ++it) {
        std::vector<double> w(n, 0.0);
        for (std::size_t i = 0; i < n; ++i) {
            double s = 0.0;
            for (std::size_t j = 0; j < n; ++j) s += m[i][j] * v[j];
            w[i] = s;
        }
        double norm_inf = 0.0;
        for (double x : w) {
            const double ax = x >= 0.0 ? x : -x;
            if (ax > norm_inf) norm_inf = ax;
        }
        if (norm_inf == 0.0) return 0.0;
        const double inv = 1.0 / norm_inf;
        for (double& x : w) x *= inv;
        v = std::move(w);
        rho = norm_inf;
    }
    return rho;
}

std::vector<double> eigenvalues_qr(const Matrix& a, int iters) {
    require_square(a);

    Matrix ak = a;
    Matrix q;
    Matrix r;
    for (int it = 0; it < iters; ++it) {
        qr_decompose(ak, q, r);
        ak = matmul(r, q);
    }

    std::vector<double> eigs(ak.size(), 0.0);
    for (std::size_t i = 0; i < ak.size(); ++i) eigs[i] = ak[i][i];
    return eigs;
}

double spectral_radius_from_eigenvalues(const std::vector<double>& eigs) noexcept {
    double best = 0.0;
    for (double z : eigs) {
        const double az = std::fabs(z);
        if (az > best) best = az;
    }
    return best;
}

} // namespace sssl::substrate
