#pragma once
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "record_stream/order_line.hpp"
#include "record_stream/person.hpp"

namespace rs {

enum class PadSide { Left, Right };

// Fixed-position line layout for one record type, declared as a table of
// (accessor, width, pad char, pad side). Each line starts with `tag`.
template <class T>
class FixedWidthLayout {
public:
  using Accessor = std::function<std::string(const T&)>;

  struct Column {
    Accessor    get;
    std::size_t width;
    char        pad;
    PadSide     side;
  };

  explicit FixedWidthLayout(std::string tag) : tag_(std::move(tag)) {}

  FixedWidthLayout& field(Accessor get, std::size_t width,
                          char pad = ' ', PadSide side = PadSide::Right) {
    cols_.push_back(Column{std::move(get), width, pad, side});
    line_width_ += width;
    return *this;
  }

  // Values longer than their column are truncated.
  std::string format(const T& rec) const {
    std::string out;
    out.reserve(tag_.size() + line_width_);
    out += tag_;
    for (const auto& c : cols_) {
      std::string v = c.get(rec);
      if (v.size() > c.width) v.resize(c.width);
      const std::size_t fill = c.width - v.size();
      if (c.side == PadSide::Left) { out.append(fill, c.pad); out += v; }
      else                         { out += v; out.append(fill, c.pad); }
    }
    return out;
  }

  template <class Range>
  std::size_t write_lines(const Range& records, std::ostream& os) const {
    std::size_t n = 0;
    for (const auto& r : records) { os << format(r) << '\n'; ++n; }
    return n;
  }

  std::size_t line_width() const noexcept { return tag_.size() + line_width_; }
  const std::string& tag() const noexcept { return tag_; }

private:
  std::string tag_;
  std::vector<Column> cols_;
  std::size_t line_width_{0};
};

// "P" + first(50) + last(50) + birth date(10).
const FixedWidthLayout<Person>& person_layout();

// "L" + product(100) + quantity(5, '0'-left) + price in cents(5, '0'-left).
const FixedWidthLayout<OrderLine>& order_line_layout();

}
