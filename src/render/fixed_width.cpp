#include "record_stream/fixed_width.hpp"
#include "record_stream/date_parse.hpp"

namespace rs {

const FixedWidthLayout<Person>& person_layout() {
  static const FixedWidthLayout<Person> layout = [] {
    FixedWidthLayout<Person> l("P");
    l.field([](const Person& p){ return p.first_name; }, 50)
     .field([](const Person& p){ return p.last_name; }, 50)
     .field([](const Person& p){ return format_date(p.birth_date); }, 10);
    return l;
  }();
  return layout;
}

const FixedWidthLayout<OrderLine>& order_line_layout() {
  static const FixedWidthLayout<OrderLine> layout = [] {
    FixedWidthLayout<OrderLine> l("L");
    l.field([](const OrderLine& o){ return o.product_name; }, 100)
     .field([](const OrderLine& o){ return std::to_string(o.quantity); }, 5, '0', PadSide::Left)
     .field([](const OrderLine& o){ return std::to_string(o.price_cents()); }, 5, '0', PadSide::Left);
    return l;
  }();
  return layout;
}

}
