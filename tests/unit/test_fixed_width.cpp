#include "record_stream/fixed_width.hpp"
#include "../support/test_support.hpp"

#include <sstream>
#include <string>
#include <vector>

struct Item { std::string code; int n; };

int main(){
  rs_test::Checker check("fixed_width");

  rs::FixedWidthLayout<Item> l("I");
  l.field([](const Item& i){ return i.code; }, 4)
   .field([](const Item& i){ return std::to_string(i.n); }, 3, '0', rs::PadSide::Left);

  check(l.line_width() == 8, "width includes tag");
  check(l.format({"AB", 7}) == "IAB  007", "right pad text, left pad number");
  check(l.format({"ABCDEFG", 12345}) == "IABCD123", "values truncated to width");
  check(l.format({"", 0}) == "I    000", "empty value fully padded");

  rs::Person p;
  p.first_name = "John";
  p.last_name = "Smith";
  p.birth_date = {1980, 3, 9};
  const std::string line = rs::person_layout().format(p);
  check(line.size() == 111, "person line width");
  check(line.compare(0, 5, "PJohn") == 0, "person tag and first name");
  check(line.compare(51, 5, "Smith") == 0, "last name column");
  check(line.compare(101, 10, "1980-03-09") == 0, "birth date column");

  rs::OrderLine o;
  o.product_name = "Widget B";
  o.quantity = 1;
  o.price = 75.50;
  const std::string ol = rs::order_line_layout().format(o);
  check(ol.size() == 111, "order line width");
  check(ol.compare(101, 5, "00001") == 0, "quantity zero padded");
  check(ol.compare(106, 5, "07550") == 0, "price in cents zero padded");

  std::ostringstream os;
  std::vector<rs::Person> people{p, p};
  check(rs::person_layout().write_lines(people, os) == 2, "write_lines count");
  check(os.str().size() == 2 * 112, "one line per record");

  return check.finish();
}
