#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// "0x1F", "31" -> 31. throws std::invalid_argument / std::out_of_range
uint32_t parse_u32_hex_or_dec(const std::string& s);

// Longest duration parse_seconds() accepts.
constexpr double kMaxSeconds = 86400.0;

// "0.5" -> 500 ms. throws std::invalid_argument on junk, std::out_of_range
// unless the value is finite and in (0, kMaxSeconds]
std::chrono::milliseconds parse_seconds(const std::string& s);

std::vector<std::string> split_csv(const std::string& s);

std::string trim(const std::string& s);
