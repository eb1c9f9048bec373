#include "engine/observe/trace_generators.hpp"

#include "engine/core/file_io.hpp"
#include "engine/core/text_format.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <sstream>

namespace sssl::observe {

namespace {

constexpr double kPi = 3.141592653589793238462643383279502884;

double clamp01(double x) noexcept {
    return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

Observation sample(double t, double e, int d) {
    Observation o;
    o.t_s = t;
    o.e_proxy = e;
    o.discharge = d;
    return o;
}

// Grid time and clamped magnitude, both rounded to 6 decimals.
Observation grid_sample(std::size_t i, double dt, double e, int d) {
    return sample(round_decimals(static_cast<double>(i) * dt, 6), round_decimals(clamp01(e), 6), d);
}

} // namespace

std::vector<Observation> negative_control_trace(std::size_t n) {
    std::vector<Observation> rows;
    rows.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double e = (i % 2 == 0) ? 1.0 : 0.0;
        const int d = (i % 3 == 0) ? 1 : 0;
        rows.push_back(sample(static_cast<double>(i), e, d));
    }
    return rows;
}

std::vector<Observation> smoke_trace() {
    std::vector<Observation> rows;
    double t = 0.0;
    double v = 0.0;

    for (int k = 0; k < 10; ++k) {
        rows.push_back(sample(t, v, 0));
        t += 1.0;
        v += 0.08;
    }
    for (int k = 0; k < 6; ++k) {
        rows.push_back(sample(t, v, 0));
        t += 1.0;
    }

    v = std::max(0.0, v - 0.6);
    rows.push_back(sample(t, v, 1));
    t += 1.0;

    for (int k = 0; k < 8; ++k) {
        rows.push_back(sample(t, v, 0));
        t += 1.0;
        v += 0.07;
    }
    return rows;
}

std::vector<Observation> mech_vibration_trace(std::size_t n, double dt) {
    n = std::max<std::size_t>(10, n);
    std::vector<Observation> rows;
    rows.reserve(n);

    // 0..7 idle, 8..25 ramp, 26..40 plateau, 41 shock, 42.. recovery.
    for (std::size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i);
        int discharge = 0;
        double e = 0.0;

        if (i <= 7) {
            e = 0.03 + 0.001 * std::sin(2 * kPi * x / 8.0);
        } else if (i <= 25) {
            const double r = (x - 8.0) / (25.0 - 8.0);
            e = 0.06 + 0.68 * r;
        } else if (i <= 40) {
            e = 0.74 + 0.008 * std::sin(2 * kPi * (x - 26.0) / 10.0);
        } else if (i == 41) {
            discharge = 1;
            e = 0.32;
        } else if (i <= 50) {
            const double r = (x - 42.0) / (50.0 - 42.0);
            e = 0.34 + 0.40 * r;
        } else {
            e = 0.74 + 0.007 * std::sin(2 * kPi * (x - 51.0) / 8.0);
        }
        rows.push_back(grid_sample(i, dt, e, discharge));
    }
    return rows;
}

std::vector<Observation> fluid_pressure_trace(std::size_t n, double dt) {
    n = std::max<std::size_t>(10, n);
    std::vector<Observation> rows;
    rows.reserve(n);

    // 0..9 idle, 10..30 pump ramp, 31..48 regulated plateau, 49 valve release, 50.. recovery.
    for (std::size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i);
        int discharge = 0;
        double e = 0.0;

        if (i <= 9) {
            e = 0.04 + 0.001 * std::sin(2 * kPi * x / 10.0);
        } else if (i <= 30) {
            const double r = (x - 10.0) / (30.0 - 10.0);
            e = 0.06 + 0.70 * r;
        } else if (i <= 48) {
            e = 0.75 + 0.009 * std::sin(2 * kPi * (x - 31.0) / 12.0);
        } else if (i == 49) {
            discharge = 1;
            e = 0.28;
        } else if (i <= 60) {
            const double r = (x - 50.0) / (60.0 - 50.0);
            e = 0.30 + 0.45 * r;
        } else {
            e = 0.75 + 0.008 * std::sin(2 * kPi * (x - 61.0) / 9.0);
        }
        rows.push_back(grid_sample(i, dt, e, discharge));
    }
    return rows;
}

std::string render_trace_csv(const std::vector<Observation>& rows, TraceStyle style) {
    std::ostringstream os;
    switch (style) {
        case TraceStyle::kPlainLf:
            os << kObservationHeader << "\n";
            for (const auto& o : rows) {
                os << static_cast<std::int64_t>(o.t_s) << ","
                   << format_shortest(o.e_proxy) << ","
                   << o.discharge << "\n";
            }
            break;
        case TraceStyle::kShortestCsv:
            write_csv_row(os, {"t_s", "E_proxy", "discharge"});
            for (const auto& o : rows) {
                write_csv_row(os, {format_shortest(o.t_s), format_shortest(o.e_proxy), std::to_string(o.discharge)});
            }
            break;
        case TraceStyle::kGeneral12Csv:
            write_csv_row(os, {"t_s", "E_proxy", "discharge"});
            for (const auto& o : rows) {
                write_csv_row(os, {format_general(o.t_s, 12), format_general(o.e_proxy, 12), std::to_string(o.discharge)});
            }
            break;
    }
    return os.str();
}

void write_trace_csv(const std::filesystem::path& out_csv,
                     const std::vector<Observation>& rows,
                     TraceStyle style) {
    write_file(out_csv, render_trace_csv(rows, style));
}

} // namespace sssl::observe
