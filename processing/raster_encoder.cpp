#include "raster_encoder.hpp"
#include "bits.hpp"
#include "../sink/png_sink.hpp"

namespace pdf417 {

bool expand_line(const Line& line, std::vector<uint8_t>& bits, Error& err){
  bits.clear();
  bits.reserve(line_bit_count(line.size()));
  for(size_t c=0;c<line.size();c++){
    if(!expand_codeword(line[c], target_bit_width(c, line.size()), bits, err)){
      err.message = "column "+std::to_string(c)+": "+err.message;
      return false;
    }
  }
  return true;
}

void build_margin_row(unsigned width, const RenderParams& P, std::vector<uint8_t>& row){
  row.assign(width, P.white);
}

bool build_data_row(const Line& line, const RenderParams& P, unsigned width,
                    std::vector<uint8_t>& row, Error& err){
  std::vector<uint8_t> bits;
  if(!expand_line(line, bits, err)) return false;
  const uint64_t qz = quiet_zone_px(P);
  if(qz + (uint64_t)bits.size()*P.bar_width > width)
    return fail(err, ErrorKind::IRREGULAR_GRID,
                "line of "+std::to_string(line.size())+" codewords does not fit image width "+std::to_string(width));
  // pre-filled white: covers both quiet zones and any right-hand padding
  row.assign(width, P.white);
  size_t x = (size_t)qz;
  for(uint8_t b: bits){
    if(b){
      for(unsigned i=0;i<P.bar_width;i++) row[x+i] = P.black;
    }
    x += P.bar_width;
  }
  return true;
}

bool RasterEncoder::encode(const Grid& grid, ImageSink& sink, std::vector<uint8_t>& out, Error& err,
                           const SinkOverrides& overrides) const {
  if(!validate_params(params_, err)) return false;
  if(!validate_grid(grid, err)) return false;

  unsigned width=0, height=0;
  if(!checked_image_size(grid, params_, width, height, err)) return false;
  // both fit in height, which fits in unsigned
  const unsigned qz = (unsigned)quiet_zone_px(params_);
  const unsigned repeat = (unsigned)row_height_px(params_);

  SinkOptions defaults;
  defaults.width = width;
  defaults.height = height;
  SinkOptions opt = merge_sink_options(defaults, overrides);
  if(log_) log_->log(LogLevel::DEBUG, "encode: %zux%zu codewords -> %ux%u px (sink %ux%u)",
                     grid.size(), grid.front().size(), width, height, opt.width, opt.height);

  std::string sink_err;
  if(!sink.open(opt, sink_err)) return fail(err, ErrorKind::SINK_FAILURE, sink_err);
  SinkGuard guard(sink);

  std::vector<uint8_t> margin;
  build_margin_row(width, params_, margin);
  for(unsigned y=0;y<qz;y++){
    if(!sink.append_row(margin, sink_err)) return fail(err, ErrorKind::SINK_FAILURE, sink_err);
  }

  std::vector<uint8_t> row;
  for(size_t r=0;r<grid.size();r++){
    if(!build_data_row(grid[r], params_, width, row, err)){
      err.message = "line "+std::to_string(r)+", "+err.message;
      return false;
    }
    for(unsigned k=0;k<repeat;k++){
      if(!sink.append_row(row, sink_err)) return fail(err, ErrorKind::SINK_FAILURE, sink_err);
    }
  }

  for(unsigned y=0;y<qz;y++){
    if(!sink.append_row(margin, sink_err)) return fail(err, ErrorKind::SINK_FAILURE, sink_err);
  }

  if(!guard.close(out, sink_err)) return fail(err, ErrorKind::SINK_FAILURE, sink_err);
  if(log_) log_->log(LogLevel::DEBUG, "encode: %u rows, %zu bytes", height, out.size());
  return true;
}

bool encode_png(const Grid& grid, const RenderParams& P, std::vector<uint8_t>& png, Error& err,
                const SinkOverrides& overrides){
  PngSink sink;
  return RasterEncoder(P).encode(grid, sink, png, err, overrides);
}

} // namespace pdf417
