#pragma once
#include <cstddef>
#include <optional>
#include <string_view>

namespace mn {

// Numeric parse of a whole token (fast_float in .cpp); surrounding
// blanks are ignored, anything else makes it fail.
std::optional<double> parse_number(std::string_view s);

// Non-negative integer argument such as a page size, a row index or a
// sample count. Rejects fractions, signs and exponents.
std::optional<std::size_t> parse_count(std::string_view s);

// True for exactly four ASCII digits.
bool is_year_label(std::string_view s) noexcept;

}
