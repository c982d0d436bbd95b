#include "util.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return "";
  auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

uint32_t parse_u32_hex_or_dec(const std::string& in) {
  const std::string s = trim(in);
  if (s.empty()) throw std::invalid_argument("empty number");
  if (s[0] == '-') throw std::out_of_range("negative value: " + s);

  size_t pos = 0;
  unsigned long long v = 0;
  if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    v = std::stoull(s.substr(2), &pos, 16);
    pos += 2;
  } else {
    v = std::stoull(s, &pos, 10);
  }
  if (pos != s.size()) throw std::invalid_argument("trailing characters in number: " + s);
  if (v > std::numeric_limits<uint32_t>::max()) throw std::out_of_range("value too large: " + s);
  return (uint32_t)v;
}

std::chrono::milliseconds parse_seconds(const std::string& in) {
  const std::string s = trim(in);
  size_t pos = 0;
  double sec = 0.0;
  try {
    sec = std::stod(s, &pos);
  } catch (const std::out_of_range&) {
    throw std::out_of_range("duration out of range: " + s);
  } catch (const std::invalid_argument&) {
    throw std::invalid_argument("invalid duration: " + s);
  }
  if (pos != s.size()) throw std::invalid_argument("trailing characters in duration: " + s);
  if (!std::isfinite(sec) || !(sec > 0.0) || sec > kMaxSeconds)
    throw std::out_of_range("duration must be > 0 and <= " + std::to_string((int)kMaxSeconds) + " s: " + s);
  const auto ms = std::chrono::milliseconds((int64_t)std::llround(sec * 1000.0));
  if (ms.count() == 0) throw std::out_of_range("duration below 1 ms: " + s);
  return ms;
}

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}
