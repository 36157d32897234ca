#include "record_stream/order_line.hpp"
#include "record_stream/field_split.hpp"
#include <cmath>

namespace rs {

std::int64_t OrderLine::price_cents() const noexcept {
  return static_cast<std::int64_t>(std::llround(price * 100.0));
}

ParseOutcome<OrderLine> OrderLineParser::try_parse(std::string_view line, std::uint64_t line_number) const {
  using Out = ParseOutcome<OrderLine>;
  auto fail = [&](ErrorCause c, std::string_view detail) {
    return Out::failure(line_error(line_number, c, detail));
  };

  std::string_view rest = line;
  std::string_view name, qty, price;
  if (!next_field(rest, delim_, name))  return fail(ErrorCause::FieldCount, "Missing product name field");
  if (!next_field(rest, delim_, qty))   return fail(ErrorCause::FieldCount, "Missing quantity field");
  if (!next_field(rest, delim_, price)) return fail(ErrorCause::FieldCount, "Missing price field");
  if (!trim(rest).empty())              return fail(ErrorCause::FieldCount, "Too many fields");

  name  = trim(name);
  qty   = trim(qty);
  price = trim(price);

  if (name.empty())  return fail(ErrorCause::EmptyField, "Product name cannot be empty");
  if (qty.empty())   return fail(ErrorCause::EmptyField, "Quantity cannot be empty");
  if (price.empty()) return fail(ErrorCause::EmptyField, "Price cannot be empty");

  auto q = policy_.parse_int(qty);
  if (!q || *q < 0) return fail(ErrorCause::InvalidValue, "Invalid quantity: " + std::string(qty));

  auto p = policy_.parse_number(price);
  if (!p || !std::isfinite(*p) || *p < 0.0)
    return fail(ErrorCause::InvalidValue, "Invalid price: " + std::string(price));

  OrderLine ol;
  ol.product_name.assign(name.data(), name.size());
  ol.quantity = *q;
  ol.price = *p;
  return Out::success(std::move(ol));
}

}
