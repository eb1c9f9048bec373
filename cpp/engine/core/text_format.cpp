#include "engine/core/text_format.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <system_error>

namespace sssl {

namespace {

std::string nonfinite_text(double x) {
    if (std::isnan(x)) return "nan";
    return x < 0.0 ? "-inf" : "inf";
}

} // namespace

std::string format_fixed(double x, int precision) {
    if (!std::isfinite(x)) return nonfinite_text(x);
    // 308 integer digits + sign + point + precision fits comfortably.
    std::array<char, 512> buf{};
    const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), x,
                                   std::chars_format::fixed, precision);
    if (res.ec != std::errc{}) return nonfinite_text(std::nan(""));
    return std::string(buf.data(), res.ptr);
}

std::string format_shortest(double x) {
    if (!std::isfinite(x)) return nonfinite_text(x);

    std::array<char, 64> buf{};
    const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), x,
                                   std::chars_format::scientific);
    if (res.ec != std::errc{}) return nonfinite_text(std::nan(""));
    const std::string sci(buf.data(), res.ptr);

    // sci is "[-]d[.ddd]e(+|-)XX"
    std::size_t pos = 0;
    const bool negative = (!sci.empty() && sci[0] == '-');
    if (negative) pos = 1;

    const std::size_t e_pos = sci.find('e', pos);
    std::string digits;
    for (std::size_t i = pos; i < e_pos; ++i) {
        if (sci[i] != '.') digits.push_back(sci[i]);
    }
    const int exp10 = std::atoi(sci.c_str() + e_pos + 1);

    std::string out;
    if (negative) out.push_back('-');

    if (exp10 < -4 || exp10 >= 16) {
        out.push_back(digits[0]);
        if (digits.size() > 1) {
            out.push_back('.');
            out.append(digits, 1, std::string::npos);
        }
        out.push_back('e');
        out.push_back(exp10 < 0 ? '-' : '+');
        const int mag = exp10 < 0 ? -exp10 : exp10;
        if (mag < 10) out.push_back('0');
        out += std::to_string(mag);
        return out;
    }

    if (exp10 < 0) {
        out += "0.";
        out.append(static_cast<std::size_t>(-exp10 - 1), '0');
        out += digits;
        return out;
    }

    const std::size_t int_len = static_cast<std::size_t>(exp10) + 1;
    if (digits.size() <= int_len) {
        out += digits;
        out.append(int_len - digits.size(), '0');
        out += ".0";
    } else {
        out.append(digits, 0, int_len);
        out.push_back('.');
        out.append(digits, int_len, std::string::npos);
    }
    return out;
}

std::string format_general(double x, int significant) {
    if (!std::isfinite(x)) return nonfinite_text(x);
    std::array<char, 64> buf{};
    const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), x,
                                   std::chars_format::general, significant);
    if (res.ec != std::errc{}) return nonfinite_text(std::nan(""));
    return std::string(buf.data(), res.ptr);
}

double round_decimals(double x, int decimals) {
    if (!std::isfinite(x)) return x;
    const std::string fixed = format_fixed(x, decimals);
    return std::strtod(fixed.c_str(), nullptr);
}

std::string trim(std::string_view v) {
    std::size_t b = 0;
    std::size_t e = v.size();
    while (b < e && std::isspace(static_cast<unsigned char>(v[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(v[e - 1]))) --e;
    return std::string(v.substr(b, e - b));
}

std::vector<std::string> split_csv_row(std::string_view line) {
    std::vector<std::string> out;
    std::string cur;
    bool in_quotes = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cur.push_back('"');
                ++i;
            } else if (c == '"') {
                in_quotes = false;
            } else {
                cur.push_back(c);
            }
        } else {
            if (c == '"') {
                in_quotes = true;
            } else if (c == ',') {
                out.push_back(cur);
                cur.clear();
            } else {
                cur.push_back(c);
            }
        }
    }
    out.push_back(cur);
    return out;
}

std::string csv_escape(const std::string& s) {
    bool need_quotes = false;
    for (char c : s) {
        if (c == ',' || c == '"' || c == '\n' || c == '\r') { need_quotes = true; break; }
    }
    if (!need_quotes) return s;

    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void write_csv_row(std::ostream& os, const std::vector<std::string>& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i) os << ',';
        os << csv_escape(fields[i]);
    }
    os << "\r\n";
}

bool try_parse_double(std::string_view s, double& out) {
    const std::string trimmed = trim(s);
    if (trimmed.empty()) return false;
    char* end = nullptr;
    const double v = std::strtod(trimmed.c_str(), &end);
    if (end == trimmed.c_str() || *end != '\0') return false;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

bool try_parse_int64(std::string_view s, std::int64_t& out) {
    const std::string trimmed = trim(s);
    if (trimmed.empty()) return false;
    const char* first = trimmed.data();
    const char* last = trimmed.data() + trimmed.size();
    if (*first == '+') {
        ++first;
        if (first == last || *first == '-') return false;
    }
    std::int64_t v = 0;
    const auto res = std::from_chars(first, last, v);
    if (res.ec != std::errc{} || res.ptr != last) return false;
    out = v;
    return true;
}

} // namespace sssl
