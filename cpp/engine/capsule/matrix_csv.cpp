#include "engine/capsule/matrix_csv.hpp"

#include "engine/core/error.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/text_format.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace sssl::capsule {

namespace {

bool is_numeric(const std::string& cell) {
    double v = 0.0;
    return try_parse_double(cell, v);
}

} // namespace

substrate::Matrix parse_matrix_rows(const std::vector<std::vector<std::string>>& rows,
                                    const std::string& source_name) {
    SSSL_ENSURE(!rows.empty(), ErrorCode::kData, "empty matrix artifact: " + source_name);

    const auto& first = rows.front();
    const bool drop_header = !std::all_of(first.begin(), first.end(), is_numeric);

    bool drop_first_col = false;
    if (rows.size() > 1) {
        std::size_t col0_numeric = 0;
        const std::size_t begin = drop_header ? 1 : 0;
        const std::size_t end = std::min<std::size_t>(rows.size(), 6);
        for (std::size_t i = begin; i < end; ++i) {
            if (!rows[i].empty() && is_numeric(rows[i][0])) ++col0_numeric;
        }
        drop_first_col = (col0_numeric == 0);
    }

    substrate::Matrix m;
    for (std::size_t i = drop_header ? 1 : 0; i < rows.size(); ++i) {
        const auto& r = rows[i];
        const std::size_t skip = (drop_first_col && r.size() > 1) ? 1 : 0;
        std::vector<double> nums;
        for (std::size_t j = skip; j < r.size(); ++j) {
            double v = 0.0;
            SSSL_ENSURE(try_parse_double(r[j], v), ErrorCode::kData,
                        "non-numeric cell '" + r[j] + "' in " + source_name);
            nums.push_back(v);
        }
        if (!nums.empty()) m.push_back(std::move(nums));
    }

    SSSL_ENSURE(!m.empty(), ErrorCode::kData, "no numeric matrix rows in " + source_name);
    for (const auto& r : m) {
        SSSL_ENSURE(r.size() == m.size(), ErrorCode::kData, "matrix not square in " + source_name);
    }
    return m;
}

substrate::Matrix read_matrix_csv(const std::filesystem::path& csv_path) {
    std::istringstream in(read_file(csv_path));
    std::vector<std::vector<std::string>> rows;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        std::vector<std::string> cells = split_csv_row(line);
        for (auto& c : cells) c = trim(c);
        rows.push_back(std::move(cells));
    }
    return parse_matrix_rows(rows, csv_path.filename().generic_string());
}

} // namespace sssl::capsule
