#pragma once
#include "image_sink.hpp"
#include "../common/image_io.hpp"

namespace pdf417 {

// Keeps the samples uncompressed. Output bytes are the raw w*h samples;
// image() stays readable after close.
class MemorySink : public ImageSink {
  ImageGray img_;
public:
  const ImageGray& image() const { return img_; }
protected:
  bool on_open(std::string& err) override;
  bool on_row(const std::vector<uint8_t>& row, std::string& err) override;
  bool on_close(std::vector<uint8_t>& out, std::string& err) override;
  void on_release() noexcept override;
};

} // namespace pdf417
