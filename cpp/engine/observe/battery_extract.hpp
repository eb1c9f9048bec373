// ============================================================================
// Fragment 3.2 — Battery Dataset Projection (cycle, disV, disI -> observations)
// File: cpp/engine/observe/battery_extract.hpp
// ============================================================================
//
// Projects an external battery table into the standard 3-column schema:
//   t_s       = cycle
//   E_proxy   = disV
//   discharge = 1 iff disI < 0
//
// - Required columns (any order, extras ignored): battery_id, cycle, disV, disI.
// - Rows are filtered to one battery_id (the first one seen when unspecified).
// - max_rows caps the number of projected rows (counted after filtering).
// - Output is sorted like the ingestor and written with 6-decimal values.
// ============================================================================

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace sssl::observe {

struct BatteryExtractOptions final {
    std::optional<std::string> battery_id;
    std::optional<std::size_t> max_rows;
};

struct BatteryExtractResult final {
    std::string battery_id;
    std::size_t rows = 0;
};

BatteryExtractResult extract_battery(const std::filesystem::path& battery_csv,
                                     const std::filesystem::path& out_csv,
                                     const BatteryExtractOptions& opt);

} // namespace sssl::observe
