#include "record_stream/people_gen.hpp"
#include <cstdio>
#include <fstream>
#include <random>
#include <string_view>

namespace rs {

static constexpr std::string_view kFirst[] = {
  "James", "Mary", "John", "Patricia", "Robert", "Jennifer", "Michael", "Linda",
  "William", "Barbara", "David", "Elizabeth", "Richard", "Susan", "Joseph", "Jessica",
  "Thomas", "Sarah", "Charles", "Karen", "Christopher", "Nancy", "Daniel", "Lisa",
  "Matthew", "Betty", "Anthony", "Margaret", "Mark", "Sandra", "Donald", "Ashley",
};

static constexpr std::string_view kLast[] = {
  "Smith", "Johnson", "Williams", "Brown", "Jones", "Garcia", "Miller", "Davis",
  "Rodriguez", "Martinez", "Hernandez", "Lopez", "Gonzalez", "Wilson", "Anderson", "Thomas",
  "Taylor", "Moore", "Jackson", "Martin", "Lee", "Perez", "Thompson", "White",
  "Harris", "Sanchez", "Clark", "Ramirez", "Lewis", "Robinson", "Walker", "Young",
};

std::uint64_t write_people(std::ostream& os, const PeopleGenConfig& cfg) {
  std::mt19937_64 rng(cfg.seed);
  std::uniform_int_distribution<size_t> first(0, std::size(kFirst) - 1);
  std::uniform_int_distribution<size_t> last(0, std::size(kLast) - 1);
  std::uniform_int_distribution<int> year(cfg.min_year, cfg.max_year);
  std::uniform_int_distribution<int> month(1, 12);
  std::uniform_int_distribution<int> day(1, 28); // valid in every month

  const char* eol = cfg.crlf ? "\r\n" : "\n";
  char date[16];
  for (std::uint64_t i = 0; i < cfg.lines; ++i) {
    std::string_view f = kFirst[first(rng)];
    std::string_view l = kLast[last(rng)];
    const int y = year(rng);
    const int m = month(rng);
    const int d = day(rng);
    std::snprintf(date, sizeof(date), "%04d-%02d-%02d", y, m, d);
    os << f << ',' << l << ',' << date << eol;
  }
  return cfg.lines;
}

bool generate_people_file(const std::string& path, const PeopleGenConfig& cfg, std::string* err) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) { if (err) *err = "cannot open for write: " + path; return false; }
  write_people(out, cfg);
  out.flush();
  if (!out) { if (err) *err = "write failed: " + path; return false; }
  return true;
}

}
