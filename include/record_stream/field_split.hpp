#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

namespace rs {

// Slice the next delimiter-separated field off the front of `line`.
// On a hit `field` is the bytes before the delimiter and `line` moves past it;
// with no delimiter left the whole remainder becomes the final field and
// `line` is emptied. Returns false only when `line` was already empty.
bool next_field(std::string_view& line, char delim, std::string_view& field) noexcept;

// Strip leading/trailing ' ', '\t', '\r', '\n'. Returns a view into `s`.
std::string_view trim(std::string_view s) noexcept;

// Split the whole line into views (no copies). `out` is cleared first.
std::size_t split_fields(std::string_view line, char delim,
                         std::vector<std::string_view>& out);

}
