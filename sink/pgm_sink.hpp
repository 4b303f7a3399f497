#pragma once
#include "image_sink.hpp"

namespace pdf417 {

// Binary PGM (P5). The header is written at open and every row goes
// straight into the output buffer.
class PgmSink : public ImageSink {
  std::vector<uint8_t> buf_;
protected:
  bool on_open(std::string& err) override;
  bool on_row(const std::vector<uint8_t>& row, std::string& err) override;
  bool on_close(std::vector<uint8_t>& out, std::string& err) override;
  void on_release() noexcept override;
};

} // namespace pdf417
