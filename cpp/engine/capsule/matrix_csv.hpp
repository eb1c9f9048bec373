// ============================================================================
// Fragment 6.1 — Capsule: Labelled Matrix Artifact Reader
// File: cpp/engine/capsule/matrix_csv.hpp
// ============================================================================
//
// Reads a square numeric matrix out of a CSV that may carry a header row
// and/or a label column, without knowing the writer's exact layout:
//
//   1. Drop the first row unless every one of its cells is numeric.
//   2. Drop the first column when none of the first-column cells in the next
//      (up to five) data rows is numeric.
//   3. Every remaining cell must be numeric, and the result must be square
//      and non-empty.
//
// Failures are ErrorCode::kData. The heuristic is approximate: a header made
// entirely of numbers is read as data.
// ============================================================================

#pragma once

#include "engine/substrate/transitions.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace sssl::capsule {

substrate::Matrix parse_matrix_rows(const std::vector<std::vector<std::string>>& rows,
                                    const std::string& source_name);

substrate::Matrix read_matrix_csv(const std::filesystem::path& csv_path);

} // namespace sssl::capsule
