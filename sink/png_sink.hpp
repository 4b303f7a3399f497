#pragma once
#include "image_sink.hpp"

namespace pdf417 {

// Grayscale 8-bit PNG. lodepng compresses the whole image at close, so the
// rows are kept until then.
class PngSink : public ImageSink {
  std::vector<uint8_t> pixels_;
protected:
  bool on_open(std::string& err) override;
  bool on_row(const std::vector<uint8_t>& row, std::string& err) override;
  bool on_close(std::vector<uint8_t>& out, std::string& err) override;
  void on_release() noexcept override;
};

} // namespace pdf417
