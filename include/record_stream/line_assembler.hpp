#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace rs {

// Turns a sequence of arbitrary read chunks into complete lines.
// Bytes after the last '\n' of a chunk are carried into the next feed(), so a
// line is never split no matter where the chunk boundary falls.
class LineAssembler {
public:
  struct Config {
    std::size_t max_line_bytes = 8 * 1024 * 1024; // 8 MiB guard per line
    bool        strip_cr       = true;            // trim trailing '\r' (CRLF)
  };

  struct Line {
    std::string_view text;      // valid only during the callback
    std::size_t      consumed;  // physical bytes incl. the '\n' (and dropped bytes)
    bool             oversize;  // text was truncated to max_line_bytes
  };

  // Return false to stop scanning the current chunk.
  using LineCallback = std::function<bool(const Line&)>;

  LineAssembler() = default;
  explicit LineAssembler(Config cfg) : cfg_(cfg) {}

  // Returns false if the callback asked to stop; the rest of the chunk and
  // any carried bytes are discarded in that case.
  bool feed(std::string_view chunk, const LineCallback& cb);

  // End of stream: a non-empty leftover becomes the final line.
  bool finish(const LineCallback& cb);

  std::size_t pending() const noexcept { return carry_bytes_; }
  std::uint64_t bytes_fed() const noexcept { return fed_; }
  void reset();

private:
  void stash(std::string_view s);
  bool emit(std::string_view text, std::size_t consumed, bool oversize, const LineCallback& cb) const;

  Config        cfg_;
  std::string   carry_;           // leftover, capped at max_line_bytes
  std::size_t   carry_bytes_{0};  // physical size of the leftover
  bool          carry_oversize_{false};
  std::uint64_t fed_{0};
};

}
