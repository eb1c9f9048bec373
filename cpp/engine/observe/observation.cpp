// ============================================================================
// Fragment 3.1 — Observation Ingestor
// File: cpp/engine/observe/observation.cpp
// ============================================================================

#include "engine/observe/observation.hpp"

#include "engine/core/error.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/text_format.hpp"

#include <algorithm>
#include <cstdint>
#include <sstream>

namespace sssl::observe {

namespace {

void strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

std::string row_context(const std::string& source, std::size_t line_no) {
    return source + " line " + std::to_string(line_no);
}

Observation parse_row(const std::string& line, const std::string& source, std::size_t line_no) {
    const auto fields = split_csv_row(line);
    if (fields.size() != 3) {
        SSSL_THROW(ErrorCode::kValidation,
                   "Bad row at " + row_context(source, line_no) + ": expected 3 fields, got " +
                       std::to_string(fields.size()) + " (" + line + ")");
    }

    Observation o;
    if (!try_parse_double(fields[0], o.t_s)) {
        SSSL_THROW(ErrorCode::kValidation,
                   "Bad row at " + row_context(source, line_no) + ": t_s not a finite number (" + line + ")");
    }
    if (!try_parse_double(fields[1], o.e_proxy)) {
        SSSL_THROW(ErrorCode::kValidation,
                   "Bad row at " + row_context(source, line_no) + ": E_proxy not a finite number (" + line + ")");
    }
    std::int64_t d = 0;
    if (!try_parse_int64(fields[2], d)) {
        SSSL_THROW(ErrorCode::kValidation,
                   "Bad row at " + row_context(source, line_no) + ": discharge not an integer (" + line + ")");
    }

    SSSL_ENSURE(o.e_proxy >= 0.0, ErrorCode::kValidation,
                "E_proxy must be >= 0 (" + row_context(source, line_no) + ")");
    SSSL_ENSURE(d == 0 || d == 1, ErrorCode::kValidation,
                "discharge must be 0 or 1 (" + row_context(source, line_no) + ")");
    o.discharge = static_cast<int>(d);
    return o;
}

} // namespace

std::vector<Observation> parse_observations_csv(std::istream& in, const std::string& source_name) {
    std::string line;
    if (!std::getline(in, line)) {
        SSSL_THROW(ErrorCode::kValidation, "CSV header must be exactly: " + std::string(kObservationHeader) +
                                               " (got empty input: " + source_name + ")");
    }
    strip_cr(line);
    if (line != kObservationHeader) {
        SSSL_THROW(ErrorCode::kValidation, "CSV header must be exactly: " + std::string(kObservationHeader) +
                                               " (got " + line + " in " + source_name + ")");
    }

    std::vector<Observation> rows;
    std::size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        strip_cr(line);
        if (line.empty()) continue;
        rows.push_back(parse_row(line, source_name, line_no));
    }
    SSSL_ENSURE(!in.bad(), ErrorCode::kIoError, "read failed: " + source_name);

    SSSL_ENSURE(rows.size() >= kMinObservations, ErrorCode::kData,
                "Need at least 2 rows to compute derivative (" + source_name + " has " +
                    std::to_string(rows.size()) + ")");

    sort_observations(rows);
    log_debug("ingested " + std::to_string(rows.size()) + " observations from " + source_name);
    return rows;
}

std::vector<Observation> read_observations(const std::filesystem::path& csv_path) {
    const std::string text = read_file(csv_path);
    std::istringstream iss(text);
    return parse_observations_csv(iss, csv_path.generic_string());
}

void sort_observations(std::vector<Observation>& rows) {
    std::stable_sort(rows.begin(), rows.end());
}

std::vector<double> compute_dedt(const std::vector<Observation>& rows) {
    std::vector<double> d(rows.size(), 0.0);
    for (std::size_t i = 1; i < rows.size(); ++i) {
        const double dt = rows[i].t_s - rows[i - 1].t_s;
        d[i] = (dt == 0.0) ? 0.0 : (rows[i].e_proxy - rows[i - 1].e_proxy) / dt;
    }
    return d;
}

} // namespace sssl::observe
