#include "engine/observe/battery_extract.hpp"

#include "engine/core/error.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/text_format.hpp"
#include "engine/observe/observation.hpp"

#include <sstream>
#include <unordered_map>
#include <vector>

namespace sssl::observe {

BatteryExtractResult extract_battery(const std::filesystem::path& battery_csv,
                                     const std::filesystem::path& out_csv,
                                     const BatteryExtractOptions& opt) {
    const std::string text = read_file(battery_csv);
    const std::string source = battery_csv.generic_string();
    std::istringstream iss(text);

    std::string line;
    const bool have_header = static_cast<bool>(std::getline(iss, line));
    if (have_header && !line.empty() && line.back() == '\r') line.pop_back();

    std::unordered_map<std::string, std::size_t> col;
    if (have_header) {
        const auto header = split_csv_row(line);
        for (std::size_t i = 0; i < header.size(); ++i) col.emplace(header[i], i);
    }
    for (const char* name : {"battery_id", "cycle", "disV", "disI"}) {
        SSSL_ENSURE(col.count(name) == 1, ErrorCode::kValidation,
                    "Battery CSV must include columns: battery_id, cycle, disV, disI (" + source + ")");
    }
    const std::size_t i_id = col["battery_id"];
    const std::size_t i_cycle = col["cycle"];
    const std::size_t i_v = col["disV"];
    const std::size_t i_i = col["disI"];

    BatteryExtractResult res;
    if (opt.battery_id) res.battery_id = *opt.battery_id;
    bool chosen = opt.battery_id.has_value();

    std::vector<Observation> rows;
    std::size_t line_no = 1;
    while (std::getline(iss, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        const auto fields = split_csv_row(line);
        auto field = [&](std::size_t idx) -> std::string {
            return idx < fields.size() ? fields[idx] : std::string{};
        };

        const std::string bid = field(i_id);
        if (!chosen) {
            res.battery_id = bid;
            chosen = true;
        }
        if (bid != res.battery_id) continue;

        Observation o;
        double dis_i = 0.0;
        if (!try_parse_double(field(i_cycle), o.t_s) ||
            !try_parse_double(field(i_v), o.e_proxy) ||
            !try_parse_double(field(i_i), dis_i)) {
            SSSL_THROW(ErrorCode::kValidation,
                       "Bad battery row at " + source + " line " + std::to_string(line_no) + " (" + line + ")");
        }
        o.discharge = dis_i < 0.0 ? 1 : 0;
        rows.push_back(o);

        if (opt.max_rows && rows.size() >= *opt.max_rows) break;
    }

    sort_observations(rows);

    std::ostringstream os;
    write_csv_row(os, {"t_s", "E_proxy", "discharge"});
    for (const auto& o : rows) {
        write_csv_row(os, {format_fixed(o.t_s, 6), format_fixed(o.e_proxy, 6), std::to_string(o.discharge)});
    }
    write_file(out_csv, os.str());

    res.rows = rows.size();
    log_info("battery " + res.battery_id + ": projected " + std::to_string(res.rows) + " rows -> " +
             out_csv.generic_string());
    return res;
}

} // namespace sssl::observe
