#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../common/error.hpp"

namespace pdf417 {

// An absent codeword renders as blank modules.
using Codeword = std::optional<uint64_t>;
using Line = std::vector<Codeword>;
using Grid = std::vector<Line>;

// At least one line, at least two codewords per line, all lines the same length.
bool validate_grid(const Grid& grid, Error& err);

// Text form: one grid line per text line, codewords separated by whitespace or
// commas, "nil" or "-" for an absent codeword, '#' starts a comment.
bool parse_grid_text(const std::string& text, Grid& grid, Error& err);
bool load_grid_text(const std::string& path, Grid& grid, Error& err);

} // namespace pdf417
