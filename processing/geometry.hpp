#pragma once
#include <cstddef>
#include <cstdint>
#include "grid.hpp"

namespace pdf417 {

constexpr unsigned CODEWORD_BITS = 17;
constexpr unsigned STOP_PATTERN_BITS = 18; // last codeword of every line

struct RenderParams {
  unsigned bar_width = 5;          // pixels per module
  unsigned quiet_zone_modules = 2;
  unsigned row_height_modules = 4; // vertical scale factor
  uint8_t black = 0;
  uint8_t white = 255;
};

// Largest image side accepted by the encoder, in pixels.
constexpr uint64_t MAX_IMAGE_DIM = 1u << 20;

inline uint64_t quiet_zone_px(const RenderParams& P){ return (uint64_t)P.quiet_zone_modules * P.bar_width; }
// Number of times each data row is repeated.
inline uint64_t row_height_px(const RenderParams& P){ return (uint64_t)P.row_height_modules * P.bar_width; }

bool validate_params(const RenderParams& P, Error& err);

// (n-2)*17 + 17 + 18 for n codewords; 0 when n < 2.
size_t line_bit_count(size_t columns);

// Shape-only; the grid is assumed to be regular (see validate_grid).
uint64_t image_width(const Grid& grid, const RenderParams& P);
uint64_t image_height(const Grid& grid, const RenderParams& P);

// image_width/image_height narrowed to unsigned; BAD_PARAMS when either side
// exceeds MAX_IMAGE_DIM.
bool checked_image_size(const Grid& grid, const RenderParams& P, unsigned& w, unsigned& h, Error& err);

} // namespace pdf417
