#pragma once
/*
================================================================================
Fragment 1.6 — Core: Deterministic Text Formatting + CSV Helpers
FILE: cpp/engine/core/text_format.hpp

Purpose:
  - Render numbers identically on every platform and under every locale
    (std::to_chars underneath, never printf/iostream float formatting).
  - Minimal RFC 4180 CSV: quote-aware split, minimal quoting on write,
    CRLF row terminator for CSV artifacts.

Formats:
  - format_fixed(x, p)   : fixed notation, p decimals, correctly rounded.
  - format_shortest(x)   : shortest round-trip digits; fixed notation for
                           decimal exponents in [-4, 16), scientific outside;
                           integral values keep a trailing ".0".
  - format_general(x, n) : n significant digits, trailing zeros removed.
================================================================================
*/

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sssl {

std::string format_fixed(double x, int precision);

std::string format_shortest(double x);

// printf("%.<sig>g") semantics.
std::string format_general(double x, int significant);

// Nearest double to the correctly rounded decimal text format_fixed(x, decimals).
double round_decimals(double x, int decimals);

std::string trim(std::string_view v);

// Quote-aware splitter ("" is the only escape inside quotes).
std::vector<std::string> split_csv_row(std::string_view line);

// Quotes only when the field holds ',', '"', '\r' or '\n'.
std::string csv_escape(const std::string& s);

// Writes the escaped fields joined by ',' and terminated by "\r\n".
void write_csv_row(std::ostream& os, const std::vector<std::string>& fields);

// Parsers never throw; surrounding whitespace is ignored.
// try_parse_double only accepts finite values.
bool try_parse_double(std::string_view s, double& out);
bool try_parse_int64(std::string_view s, std::int64_t& out);

} // namespace sssl
