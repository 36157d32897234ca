#pragma once
#include <cstdint>
#include <ostream>
#include <string>

namespace rs {

struct PeopleGenConfig {
  std::uint64_t lines = 150000;
  std::uint64_t seed  = 42;
  int  min_year = 1940;
  int  max_year = 2005;
  bool crlf     = false;
};

// Writes "First,Last,YYYY-MM-DD" lines. Same seed -> same bytes.
std::uint64_t write_people(std::ostream& os, const PeopleGenConfig& cfg);

// Returns false if the file cannot be written.
bool generate_people_file(const std::string& path, const PeopleGenConfig& cfg, std::string* err = nullptr);

}
