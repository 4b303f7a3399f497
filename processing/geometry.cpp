#include "geometry.hpp"

namespace pdf417 {

bool validate_params(const RenderParams& P, Error& err){
  if(P.bar_width==0) return fail(err, ErrorKind::BAD_PARAMS, "bar_width must be >= 1");
  if(P.row_height_modules==0) return fail(err, ErrorKind::BAD_PARAMS, "row_height_modules must be >= 1");
  return true;
}

size_t line_bit_count(size_t columns){
  if(columns<2) return 0;
  // regular codewords + start pattern + stop pattern
  return (columns-2)*CODEWORD_BITS + CODEWORD_BITS + STOP_PATTERN_BITS;
}

uint64_t image_width(const Grid& grid, const RenderParams& P){
  uint64_t cols = grid.empty() ? 0 : grid.front().size();
  return line_bit_count(cols)*(uint64_t)P.bar_width + 2*quiet_zone_px(P);
}

uint64_t image_height(const Grid& grid, const RenderParams& P){
  return (uint64_t)grid.size()*row_height_px(P) + 2*quiet_zone_px(P);
}

bool checked_image_size(const Grid& grid, const RenderParams& P, unsigned& w, unsigned& h, Error& err){
  const uint64_t cols = grid.empty() ? 0 : grid.front().size();
  // every term is bounded first so the products below cannot wrap
  if(P.bar_width>MAX_IMAGE_DIM || quiet_zone_px(P)>MAX_IMAGE_DIM || row_height_px(P)>MAX_IMAGE_DIM ||
     line_bit_count(cols)>MAX_IMAGE_DIM || grid.size()>MAX_IMAGE_DIM)
    return fail(err, ErrorKind::BAD_PARAMS,
                "bar_width "+std::to_string(P.bar_width)+" with "+std::to_string(grid.size())+"x"+
                std::to_string(cols)+" codewords exceeds "+std::to_string(MAX_IMAGE_DIM)+" px per side");
  const uint64_t W = image_width(grid, P), H = image_height(grid, P);
  if(W>MAX_IMAGE_DIM || H>MAX_IMAGE_DIM)
    return fail(err, ErrorKind::BAD_PARAMS,
                "image "+std::to_string(W)+"x"+std::to_string(H)+" px exceeds "+
                std::to_string(MAX_IMAGE_DIM)+" px per side");
  w = (unsigned)W;
  h = (unsigned)H;
  return true;
}

} // namespace pdf417
