#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pdf417 {

struct PixelFormat {
  unsigned channels = 1;
  unsigned bit_depth = 8;
};

inline bool operator==(const PixelFormat& a, const PixelFormat& b){
  return a.channels==b.channels && a.bit_depth==b.bit_depth;
}
inline bool operator!=(const PixelFormat& a, const PixelFormat& b){ return !(a==b); }

// Called once per accepted row, y counting from 0 at the top.
using RowCallback = std::function<void(unsigned y, const std::vector<uint8_t>& row)>;

struct SinkOptions {
  unsigned width = 0, height = 0;
  PixelFormat format;
  RowCallback on_row;
};

// Caller-supplied options; every field that is set replaces the default.
struct SinkOverrides {
  std::optional<unsigned> width, height;
  std::optional<PixelFormat> format;
  RowCallback on_row;
};

SinkOptions merge_sink_options(SinkOptions defaults, const SinkOverrides& o);

// Streaming row-major image writer. The base class owns the bookkeeping
// (row length, row count, format, row callback); subclasses only see rows
// that passed those checks. A sink can be reused once closed or released.
class ImageSink {
public:
  virtual ~ImageSink() = default;

  bool open(const SinkOptions& opt, std::string& err);
  bool append_row(const std::vector<uint8_t>& row, std::string& err);
  // Finalizes and hands over the encoded bytes. On failure nothing is
  // written to out and the sink is released.
  bool close(std::vector<uint8_t>& out, std::string& err);
  // Drops any partial state. No-op unless open.
  void release() noexcept;

  bool is_open() const { return open_; }
  unsigned rows_written() const { return rows_; }
  const SinkOptions& options() const { return opt_; }

protected:
  virtual bool on_open(std::string& err) = 0;
  virtual bool on_row(const std::vector<uint8_t>& row, std::string& err) = 0;
  virtual bool on_close(std::vector<uint8_t>& out, std::string& err) = 0;
  virtual void on_release() noexcept = 0;

private:
  SinkOptions opt_;
  unsigned rows_ = 0;
  bool open_ = false;
};

// Holds an open sink for one encode: close() finalizes it, any other exit
// path releases it.
class SinkGuard {
  ImageSink& sink_;
  bool done_ = false;
public:
  explicit SinkGuard(ImageSink& s) : sink_(s) {}
  ~SinkGuard(){ if(!done_) sink_.release(); }
  SinkGuard(const SinkGuard&) = delete;
  SinkGuard& operator=(const SinkGuard&) = delete;

  bool close(std::vector<uint8_t>& out, std::string& err){
    done_ = true;
    return sink_.close(out, err);
  }
};

} // namespace pdf417
