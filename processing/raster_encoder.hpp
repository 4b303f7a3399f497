#pragma once
#include <cstdint>
#include <vector>
#include "grid.hpp"
#include "geometry.hpp"
#include "../common/error.hpp"
#include "../common/logger.hpp"
#include "../sink/image_sink.hpp"

namespace pdf417 {

// Concatenated bit pattern of one line, column order.
bool expand_line(const Line& line, std::vector<uint8_t>& bits, Error& err);

// One pixel row: quiet zone, bar_width samples per bit, quiet zone.
// Rows whose pattern is shorter than the symbol (absent stop pattern) are
// padded with white on the right up to width.
bool build_data_row(const Line& line, const RenderParams& P, unsigned width,
                    std::vector<uint8_t>& row, Error& err);

void build_margin_row(unsigned width, const RenderParams& P, std::vector<uint8_t>& row);

// Renders a codeword grid top to bottom into an ImageSink:
//   quiet_zone_px white rows
//   each line's data row, row_height_px times
//   quiet_zone_px white rows
// The grid is only read during encode() and nothing is kept between calls.
class RasterEncoder {
  RenderParams params_;
  Logger* log_;
public:
  explicit RasterEncoder(const RenderParams& P, Logger* log = nullptr)
  : params_(P), log_(log) {}

  const RenderParams& params() const { return params_; }

  bool encode(const Grid& grid, ImageSink& sink, std::vector<uint8_t>& out, Error& err,
              const SinkOverrides& overrides = SinkOverrides{}) const;
};

// PNG bytes in memory for grid.
bool encode_png(const Grid& grid, const RenderParams& P, std::vector<uint8_t>& png, Error& err,
                const SinkOverrides& overrides = SinkOverrides{});

} // namespace pdf417
