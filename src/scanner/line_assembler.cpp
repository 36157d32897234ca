#include "record_stream/line_assembler.hpp"

namespace rs {

void LineAssembler::reset() {
  carry_.clear();
  carry_bytes_ = 0;
  carry_oversize_ = false;
}

void LineAssembler::stash(std::string_view s) {
  carry_bytes_ += s.size();
  const std::size_t room = cfg_.max_line_bytes > carry_.size() ? cfg_.max_line_bytes - carry_.size() : 0;
  if (s.size() > room) {
    carry_.append(s.substr(0, room));
    carry_oversize_ = true;
  } else {
    carry_.append(s);
  }
}

bool LineAssembler::emit(std::string_view text, std::size_t consumed, bool oversize,
                         const LineCallback& cb) const {
  if (cfg_.strip_cr && !text.empty() && text.back() == '\r') text.remove_suffix(1);
  return cb(Line{text, consumed, oversize});
}

bool LineAssembler::feed(std::string_view block, const LineCallback& cb) {
  fed_ += block.size();
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = block.find('\n', start);
    if (pos == std::string_view::npos) {
      // unfinished line -> carry into the next chunk
      stash(block.substr(start));
      return true;
    }

    std::string_view slice = block.substr(start, pos - start);
    start = pos + 1;

    bool go;
    if (carry_bytes_ > 0) {
      stash(slice);
      go = emit(std::string_view(carry_.data(), carry_.size()), carry_bytes_ + 1, carry_oversize_, cb);
      reset();
    } else if (slice.size() > cfg_.max_line_bytes) {
      go = emit(slice.substr(0, cfg_.max_line_bytes), slice.size() + 1, true, cb);
    } else {
      go = emit(slice, slice.size() + 1, false, cb);
    }

    if (!go) { reset(); return false; }
  }
}

bool LineAssembler::finish(const LineCallback& cb) {
  if (carry_bytes_ == 0) return true;
  std::string last;
  last.swap(carry_);
  const std::size_t consumed = carry_bytes_;
  const bool oversize = carry_oversize_;
  reset();
  return emit(std::string_view(last.data(), last.size()), consumed, oversize, cb);
}

}
