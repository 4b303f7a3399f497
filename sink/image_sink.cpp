#include "image_sink.hpp"

namespace pdf417 {

SinkOptions merge_sink_options(SinkOptions defaults, const SinkOverrides& o){
  if(o.width)  defaults.width  = *o.width;
  if(o.height) defaults.height = *o.height;
  if(o.format) defaults.format = *o.format;
  if(o.on_row) defaults.on_row = o.on_row;
  return defaults;
}

bool ImageSink::open(const SinkOptions& opt, std::string& err){
  if(open_){ err="sink already open"; return false; }
  if(opt.format!=PixelFormat{}){
    err="unsupported pixel format: "+std::to_string(opt.format.channels)+" channel(s), "+
        std::to_string(opt.format.bit_depth)+"-bit (only 1 channel 8-bit)";
    return false;
  }
  if(opt.width==0 || opt.height==0){ err="image size must be non-zero"; return false; }
  opt_ = opt;
  rows_ = 0;
  if(!on_open(err)) return false;
  open_ = true;
  return true;
}

bool ImageSink::append_row(const std::vector<uint8_t>& row, std::string& err){
  if(!open_){ err="sink not open"; return false; }
  if(row.size()!=opt_.width){
    err="row "+std::to_string(rows_)+" has "+std::to_string(row.size())+
        " samples, image width is "+std::to_string(opt_.width);
    return false;
  }
  if(rows_>=opt_.height){
    err="row "+std::to_string(rows_)+" exceeds image height "+std::to_string(opt_.height);
    return false;
  }
  if(!on_row(row, err)) return false;
  if(opt_.on_row) opt_.on_row(rows_, row);
  rows_++;
  return true;
}

bool ImageSink::close(std::vector<uint8_t>& out, std::string& err){
  if(!open_){ err="sink not open"; return false; }
  if(rows_!=opt_.height){
    err="image incomplete: "+std::to_string(rows_)+" of "+std::to_string(opt_.height)+" rows";
    release();
    return false;
  }
  std::vector<uint8_t> bytes;
  if(!on_close(bytes, err)){
    release();
    return false;
  }
  open_ = false;
  out.swap(bytes);
  return true;
}

void ImageSink::release() noexcept {
  if(!open_) return;
  open_ = false;
  rows_ = 0;
  on_release();
}

} // namespace pdf417
