#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "record_stream/parse_policy.hpp"
#include "record_stream/record_parser.hpp"

namespace rs {

struct OrderLine {
  std::string   product_name;
  std::int64_t  quantity = 0;
  double        price = 0.0;

  // Price in whole cents, rounded half away from zero.
  std::int64_t price_cents() const noexcept;
};

// "Product,Quantity,Price"; quantity is a non-negative integer, price a
// non-negative decimal.
class OrderLineParser {
public:
  using record_type = OrderLine;

  explicit OrderLineParser(char delimiter = ',') : delim_(delimiter) {}

  ParseOutcome<OrderLine> try_parse(std::string_view line, std::uint64_t line_number) const;

private:
  char delim_;
  ParsePolicy policy_;
};

}
